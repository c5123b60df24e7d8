#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Timeouts are expressed in milliseconds.
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu; // wait forever

void SleepMs(int ms);

// Monotonic time in microseconds.
uint64_t NowUs();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();                        // block until count>0, then --count
    bool take(uint32_t timeout_ms);     // false if the timeout expired first
    bool try_take();                    // non-blocking: if count>0 then --count, else false
    void give();                        // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// Circular buffer synchronized with the Mutex and CountingSemaphore
// primitives above. send() blocks while the queue is full and receive()
// blocks while it is empty, each bounded by a timeout in milliseconds.
template <typename T, size_t Capacity>
class Queue {
public:
    Queue() : head(0), tail(0) {}

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (timeout_ms == MAX_TIMEOUT) {
            spaceAvailable.take();
        } else if (!spaceAvailable.take(timeout_ms)) {
            return false;
        }
        push(item);
        return true;
    }

    bool try_send(const T& item) {
        if (!spaceAvailable.try_take()) return false;
        push(item);
        return true;
    }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (timeout_ms == MAX_TIMEOUT) {
            dataAvailable.take();
        } else if (!dataAvailable.take(timeout_ms)) {
            return false;
        }
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

private:
    void push(const T& item) {
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
    }

    T buffer[Capacity];
    size_t head, tail;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
