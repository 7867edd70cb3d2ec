#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace job_system {

// What stopped the pool, if anything
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc escaped a job
    Exception,     // other std::exception escaped a job
    Unhandled      // non-std::exception escaped a job
};

/**
 * Work-stealing thread pool.
 *
 * Each worker owns a deque. Submissions are spread round-robin; an idle
 * worker takes the oldest job of another worker. Exceptions never leave a
 * worker thread: the first one is recorded, and every job still queued at
 * that point is discarded.
 */
template<typename JobType>
class JobSystem {
private:
    struct Worker {
        std::deque<JobPtr<JobType>> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<std::size_t> jobs_executed{0};
        std::atomic<std::size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<std::size_t> next_worker_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    // Jobs submitted and not yet finished or discarded
    std::atomic<std::size_t> pending_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    mutable std::mutex error_mutex_;
    std::string error_message_;

    JobPtr<JobType> pop_local(Worker& worker) {
        std::lock_guard<std::mutex> lock(worker.mutex);
        if (worker.tasks.empty()) {
            return nullptr;
        }
        JobPtr<JobType> job = std::move(worker.tasks.back());
        worker.tasks.pop_back();
        return job;
    }

    JobPtr<JobType> steal(std::size_t thief) {
        for (std::size_t offset = 1; offset < workers_.size(); ++offset) {
            Worker& victim = *workers_[(thief + offset) % workers_.size()];
            std::unique_lock<std::mutex> lock(victim.mutex, std::try_to_lock);
            if (!lock.owns_lock() || victim.tasks.empty()) {
                continue;
            }
            JobPtr<JobType> job = std::move(victim.tasks.front());
            victim.tasks.pop_front();
            workers_[thief]->jobs_stolen.fetch_add(1, std::memory_order_relaxed);
            return job;
        }
        return nullptr;
    }

    void finish(std::size_t count) {
        if (pending_.fetch_sub(count, std::memory_order_acq_rel) == count) {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            completion_cv_.notify_all();
        }
    }

    void record_error(ErrorType type, const char* message) {
        ErrorType expected = ErrorType::None;
        if (error_type_.compare_exchange_strong(expected, type, std::memory_order_acq_rel)) {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_message_ = message;
        }
#ifdef JOBSYSTEM_DEBUG
        printf("[JOB_SYSTEM DEBUG] job failed: %s\n", message);
        fflush(stdout);
#endif
        discard_queued();
    }

    void discard_queued() {
        std::size_t dropped = 0;
        for (auto& worker : workers_) {
            std::lock_guard<std::mutex> lock(worker->mutex);
            dropped += worker->tasks.size();
            worker->tasks.clear();
        }
        if (dropped > 0) {
            finish(dropped);
        }
    }

    void run(Job<JobType>& job) {
        try {
            job.execute();
        } catch (const std::bad_alloc& e) {
            record_error(ErrorType::OutOfMemory, e.what());
        } catch (const std::exception& e) {
            record_error(ErrorType::Exception, e.what());
        } catch (...) {
            record_error(ErrorType::Unhandled, "non-standard exception");
        }
    }

    void worker_loop(std::size_t index) {
        Worker& self = *workers_[index];

        while (true) {
            JobPtr<JobType> job = pop_local(self);
            if (!job) {
                job = steal(index);
            }

            if (job) {
                run(*job);
                self.jobs_executed.fetch_add(1, std::memory_order_relaxed);
                finish(1);
                continue;
            }

            std::unique_lock<std::mutex> lock(self.mutex);
            if (stopping_.load() && self.tasks.empty()) {
                break;
            }
            // Short timeout so an idle worker keeps checking its peers
            self.cv.wait_for(lock, std::chrono::milliseconds(1), [this, &self] {
                return stopping_.load() || !self.tasks.empty();
            });
        }
    }

    void enqueue(Worker& worker, JobPtr<JobType> job, ScheduleMode mode) {
        if (!running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        pending_.fetch_add(1, std::memory_order_acq_rel);
        {
            std::lock_guard<std::mutex> lock(worker.mutex);
            if (mode == ScheduleMode::LIFO) {
                worker.tasks.push_back(std::move(job));
            } else {
                worker.tasks.push_front(std::move(job));
            }
        }
        worker.cv.notify_one();
    }

public:
    // Zero threads means one per hardware thread
    explicit JobSystem(std::size_t num_threads = 0) {
        std::size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workers_.push_back(std::make_unique<Worker>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (running_.load()) return;

        stopping_.store(false);
        pending_.store(0);
        error_type_.store(ErrorType::None);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_message_.clear();
        }

        for (std::size_t i = 0; i < workers_.size(); ++i) {
            workers_[i]->thread = std::thread([this, i] { worker_loop(i); });
        }
        running_.store(true);
    }

    // Runs every job already queued, then joins the workers
    void shutdown() {
        if (!running_.load()) return;

        stopping_.store(true);
        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
            }
            worker->cv.notify_all();
        }
        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }
        running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        std::size_t index = next_worker_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
        enqueue(*workers_[index], std::move(job), mode);
    }

    void submit_to_worker(std::size_t worker_id, JobPtr<JobType> job,
                          ScheduleMode mode = ScheduleMode::LIFO) {
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }
        enqueue(*workers_[worker_id], std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), type), mode);
    }

    // Blocks until every submitted job has run or been discarded
    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] {
            return pending_.load(std::memory_order_acquire) == 0;
        });
    }

    std::size_t get_num_workers() const {
        return workers_.size();
    }

    std::size_t get_pending_count() const {
        return pending_.load(std::memory_order_relaxed);
    }

    bool is_running() const {
        return running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    // what() of the first exception that escaped a job
    std::string get_error_message() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return error_message_;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    struct Statistics {
        std::size_t jobs_executed;
        std::size_t jobs_stolen;
    };

    Statistics get_statistics() const {
        Statistics stats{0, 0};
        for (const auto& worker : workers_) {
            stats.jobs_executed += worker->jobs_executed.load();
            stats.jobs_stolen += worker->jobs_stolen.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
