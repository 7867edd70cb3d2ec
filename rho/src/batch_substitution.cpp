#include <rho/batch_substitution.hpp>
#include <rho/debug_log.hpp>
#include <stdexcept>

namespace rho {

BatchSubstituter::BatchSubstituter(std::size_t num_threads)
    : pool_(num_threads) {
    pool_.start();
}

BatchSubstituter::BatchSubstituter(std::size_t num_threads, const TermCanonicalizer& canonicalizer)
    : substituter_(canonicalizer)
    , pool_(num_threads) {
    pool_.start();
}

BatchSubstituter::~BatchSubstituter() {
    pool_.shutdown();
}

std::vector<SubstitutionOutcome> BatchSubstituter::substitute_all(
    const std::vector<SubstitutionRequest>& requests) {
    std::lock_guard<std::mutex> lock(batch_mutex_);

    std::vector<SubstitutionOutcome> outcomes(requests.size());

    // Each job writes only its own slot
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const SubstitutionRequest* request = &requests[i];
        SubstitutionOutcome* outcome = &outcomes[i];
        pool_.submit_function([this, request, outcome, i]() {
            try {
                outcome->term = substituter_.substitute(request->term, request->env);
            } catch (const IllegalSubstitutionError& e) {
                RHO_DEBUG_LOG("Request %zu rejected: %s", i, e.what());
                outcome->error = e.what();
            }
            (void)i;
        }, SubstitutionJobType::SUBSTITUTE, job_system::ScheduleMode::FIFO);
    }

    pool_.wait_for_completion();

    if (pool_.has_error()) {
        std::string message = std::string("Batch substitution failed: ") +
                              pool_.get_error_description() + ": " + pool_.get_error_message();
        // Restart so the next batch starts with a clean pool
        pool_.shutdown();
        pool_.start();
        throw std::runtime_error(message);
    }

    return outcomes;
}

} // namespace rho
