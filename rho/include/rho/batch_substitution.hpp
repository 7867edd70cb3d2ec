#ifndef RHO_BATCH_SUBSTITUTION_HPP
#define RHO_BATCH_SUBSTITUTION_HPP

#include <rho/par.hpp>
#include <rho/env.hpp>
#include <rho/substitute.hpp>
#include <job_system/job_system.hpp>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace rho {

// Tag for jobs submitted to the worker pool
enum class SubstitutionJobType {
    SUBSTITUTE
};

struct SubstitutionRequest {
    Par term;
    Env env;
};

/**
 * Result of one request. On success `term` holds the substituted term and
 * `error` is empty; a rejected request leaves `term` empty and carries the
 * illegal-substitution message.
 */
struct SubstitutionOutcome {
    Par term;
    std::string error;

    bool ok() const { return error.empty(); }
};

/**
 * Runs independent substitutions concurrently.
 *
 * Each request has its own environment, so requests never share mutable
 * state; results come back in request order and are identical to those of
 * sequential substitute() calls.
 */
class BatchSubstituter {
public:
    // Zero threads means one per hardware thread
    explicit BatchSubstituter(std::size_t num_threads = 0);
    BatchSubstituter(std::size_t num_threads, const TermCanonicalizer& canonicalizer);
    ~BatchSubstituter();

    BatchSubstituter(const BatchSubstituter&) = delete;
    BatchSubstituter& operator=(const BatchSubstituter&) = delete;

    /**
     * Substitute every request. Blocks until all are done. Calls from
     * different threads are serialized.
     *
     * Throws std::runtime_error if a job fails for a reason other than an
     * illegal substitution (e.g. std::bad_alloc).
     */
    std::vector<SubstitutionOutcome> substitute_all(const std::vector<SubstitutionRequest>& requests);

    std::size_t num_threads() const { return pool_.get_num_workers(); }

private:
    Substituter substituter_;
    job_system::JobSystem<SubstitutionJobType> pool_;
    std::mutex batch_mutex_;
};

} // namespace rho

#endif // RHO_BATCH_SUBSTITUTION_HPP
