#include <QCoreApplication>
#include "AppConstants.h"
#include "Commands.h"
#include "Logging.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    const int rc = Commands::run(app.arguments());
    appLogger()->flush();
    return rc;
}
