#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <memory>
#include <type_traits>
#include <utility>

namespace job_system {

/**
 * Unit of work run by a JobSystem worker.
 * JobType is a caller-defined tag (usually an enum) used for statistics.
 */
template<typename JobType>
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
    virtual JobType get_type() const = 0;
};

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

// Wraps any nullary callable
template<typename JobType, typename Func>
class FunctionJob : public Job<JobType> {
    static_assert(std::is_invocable_v<Func&>, "Job function must be callable with no arguments");

    Func function_;
    JobType type_;

public:
    template<typename F>
    FunctionJob(F&& func, JobType type)
        : function_(std::forward<F>(func)), type_(type) {}

    void execute() override {
        function_();
    }

    JobType get_type() const override {
        return type_;
    }
};

template<typename JobType, typename Func>
JobPtr<JobType> make_job(Func&& func, JobType type) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(
        std::forward<Func>(func), type);
}

enum class ScheduleMode {
    LIFO,  // newest first, keeps related work hot in cache
    FIFO   // oldest first
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
