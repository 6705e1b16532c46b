#include <cassert>
#include <cstdio>
#include <QAtomicInt>
#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QSet>
#include <QTemporaryDir>
#include <QTextStream>
#include <QThread>
#include <memory>
#include <vector>
#include "dataset/UndoStack.h"

void test_push_pop_order() {
    QTemporaryDir dir;
    UndoStack stack(dir.filePath("data/undo.txt"));
    assert(stack.push("/d/a.mp4"));
    assert(stack.push("/d/b.mp4"));
    assert(stack.size() == 2);

    assert(stack.pop() == QString("/d/b.mp4"));
    assert(stack.pop() == QString("/d/a.mp4"));
    assert(!stack.pop().has_value());
    printf("PASS: test_push_pop_order\n");
}

void test_capacity_keeps_last_ten() {
    QTemporaryDir dir;
    UndoStack stack(dir.filePath("undo.txt"), 10);
    for (int i = 1; i <= 12; ++i)
        assert(stack.push(QString("/clips/%1.mp4").arg(i)));

    const QStringList entries = stack.entries();
    assert(entries.size() == 10);
    assert(entries.first() == "/clips/3.mp4");
    assert(entries.last() == "/clips/12.mp4");

    for (int i = 12; i >= 3; --i)
        assert(stack.pop() == QString("/clips/%1.mp4").arg(i));
    assert(!stack.pop().has_value());
    printf("PASS: test_capacity_keeps_last_ten\n");
}

void test_log_format_and_persistence() {
    QTemporaryDir dir;
    const QString log = dir.filePath("undo.txt");
    {
        UndoStack stack(log);
        stack.push("/x/one.mp4");
        stack.push("/x/two.mp4");
    }

    QFile file(log);
    assert(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QString::fromUtf8(file.readAll());
    assert(text == "/x/one.mp4\n/x/two.mp4\n");
    file.close();

    // A second instance (another process) sees the same stack
    UndoStack reopened(log);
    assert(reopened.size() == 2);
    assert(reopened.pop() == QString("/x/two.mp4"));

    UndoStack third(log);
    assert(third.entries() == QStringList{"/x/one.mp4"});
    printf("PASS: test_log_format_and_persistence\n");
}

void test_oversized_log_is_trimmed() {
    QTemporaryDir dir;
    const QString log = dir.filePath("undo.txt");
    QFile file(log);
    assert(file.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&file);
    for (int i = 0; i < 15; ++i) out << "/old/" << i << ".mp4\n";
    out << "\n";
    out.flush();
    file.close();

    UndoStack stack(log);
    assert(stack.size() == 10);
    assert(stack.pop() == QString("/old/14.mp4"));
    assert(stack.size() == 9);
    printf("PASS: test_oversized_log_is_trimmed\n");
}

void test_pop_does_not_touch_files() {
    QTemporaryDir dir;
    const QString clip = dir.filePath("clip.mp4");
    QFile f(clip);
    assert(f.open(QIODevice::WriteOnly));
    f.write("x");
    f.close();

    UndoStack stack(dir.filePath("undo.txt"));
    stack.push(clip);
    assert(stack.pop() == clip);
    assert(QFile::exists(clip));
    printf("PASS: test_pop_does_not_touch_files\n");
}

// Several threads, two stacks over one log: no push is lost
static void pushConcurrently(int capacity, int threads, int perThread) {
    QTemporaryDir dir;
    const QString log = dir.filePath("undo.txt");
    UndoStack first(log, capacity);
    UndoStack second(log, capacity);
    assert(first.capacity() == capacity);

    QAtomicInt failures(0);
    std::vector<std::unique_ptr<QThread>> workers;
    for (int t = 0; t < threads; ++t) {
        UndoStack* stack = (t % 2 == 0) ? &first : &second;
        workers.emplace_back(QThread::create([stack, t, perThread, &failures] {
            for (int i = 0; i < perThread; ++i) {
                if (!stack->push(QString("/clips/t%1_%2.mp4").arg(t).arg(i)))
                    failures.fetchAndAddOrdered(1);
            }
        }));
    }
    for (auto& w : workers) w->start();
    for (auto& w : workers) w->wait();
    assert(failures.loadAcquire() == 0);

    const int total = threads * perThread;
    const QStringList entries = first.entries();
    assert(entries.size() == qMin(capacity, total));
    const QSet<QString> distinct(entries.begin(), entries.end());
    assert(distinct.size() == entries.size());

    // Each thread's own pushes stay in order
    for (int t = 0; t < threads; ++t) {
        int previous = -1;
        const QString prefix = QString("/clips/t%1_").arg(t);
        for (const QString& e : entries) {
            if (!e.startsWith(prefix)) continue;
            const int i = e.mid(prefix.size()).chopped(4).toInt();
            assert(i > previous);
            previous = i;
        }
    }
}

void test_concurrent_pushes_lose_nothing() {
    pushConcurrently(1000, 4, 25);
    pushConcurrently(10, 4, 25);
    printf("PASS: test_concurrent_pushes_lose_nothing\n");
}

void test_held_lock_blocks_push() {
    QTemporaryDir dir;
    UndoStack stack(dir.filePath("undo.txt"));

    QLockFile held(stack.logPath() + ".lock");
    assert(held.tryLock(0));

    QAtomicInt done(0);
    std::unique_ptr<QThread> worker(QThread::create([&stack, &done] {
        bool ok = stack.push("/clips/late.mp4");
        assert(ok);
        (void)ok;
        done.storeRelease(1);
    }));
    worker->start();

    QThread::msleep(300);
    assert(done.loadAcquire() == 0);
    assert(!QFile::exists(stack.logPath()));

    held.unlock();
    assert(worker->wait(10000));
    assert(done.loadAcquire() == 1);
    assert(stack.entries() == QStringList{"/clips/late.mp4"});
    printf("PASS: test_held_lock_blocks_push\n");
}

void test_error_cleared_by_next_call() {
    QTemporaryDir dir;
    const QString log = dir.filePath("undo.txt");
    UndoStack stack(log);

    // A directory where the log should be makes the write fail
    assert(QDir().mkpath(log));
    assert(!stack.push("/clips/a.mp4"));
    assert(!stack.errorString().isEmpty());

    assert(QDir().rmdir(log));
    assert(!stack.pop().has_value());
    assert(stack.errorString().isEmpty());
    printf("PASS: test_error_cleared_by_next_call\n");
}

int main() {
    test_push_pop_order();
    test_capacity_keeps_last_ten();
    test_log_format_and_persistence();
    test_oversized_log_is_trimmed();
    test_pop_does_not_touch_files();
    test_concurrent_pushes_lose_nothing();
    test_held_lock_blocks_push();
    test_error_cleared_by_next_call();
    printf("All undo stack tests passed.\n");
    return 0;
}
