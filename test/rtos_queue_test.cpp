#include "os/rtos.hpp"
#include <iostream>

// Bounded job queue of ints, capacity 5
Rtos::Queue<int, 5> queue;

static int g_received[10];
static int g_failures = 0;

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

void Producer(void*) {
    std::cout << "[Producer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        queue.send(i);  // blocks while the queue is full
        Rtos::SleepMs(5);
    }
}

void Consumer(void*) {
    Rtos::SleepMs(100);   // let the producer fill the queue
    std::cout << "[Consumer] Thread started\n";
    for (int i = 0; i < 10; ++i) {
        int value = 0;
        queue.receive(value);
        g_received[i] = value;
        Rtos::SleepMs(10);
    }
}

int main() {
    {
        std::cout << "[Test 0] Producer / consumer keep FIFO order\n";
        Rtos::Task producerTask;
        Rtos::Task consumerTask;

        const bool created = producerTask.Create("Producer", Producer, nullptr) &&
                             consumerTask.Create("Consumer", Consumer, nullptr);
        printResult("tasks created", created);

        producerTask.Join();
        consumerTask.Join();

        bool ordered = true;
        for (int i = 0; i < 10; ++i) ordered = ordered && g_received[i] == i + 1;
        printResult("received 1..10 in order", ordered);
    }

    {
        std::cout << "\n[Test 1] Non-blocking and timed operations\n";
        Rtos::Queue<int, 3> q;
        int v = 0;
        printResult("try_receive on empty", !q.try_receive(v));

        const uint64_t t0 = Rtos::NowUs();
        printResult("receive times out", !q.receive(v, 50));
        printResult("waited ~50 ms", Rtos::NowUs() - t0 >= 40000);

        printResult("fill", q.try_send(7) && q.try_send(8) && q.try_send(9));
        printResult("try_send when full", !q.try_send(10));
        printResult("send times out when full", !q.send(10, 20));

        printResult("drain in order", q.try_receive(v) && v == 7 &&
                                      q.receive(v, 10) && v == 8 &&
                                      q.try_receive(v) && v == 9);

        // Wrap the ring buffer.
        printResult("wraparound", q.try_send(1) && q.try_send(2) && q.try_receive(v) && v == 1 &&
                                  q.try_send(3) && q.try_send(4) && q.try_receive(v) && v == 2 &&
                                  q.try_receive(v) && v == 3 && q.try_receive(v) && v == 4);
    }

    if (g_failures) {
        std::cout << "\nrtos_queue_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nrtos_queue_test: PASS\n";
    return 0;
}
