/**
 * Substitution Basics Example
 *
 * Demonstrates:
 * - Building terms with the builders
 * - Binding values in an environment
 * - Substituting through binders
 * - Batch substitution on the worker pool
 */

#include <rho/builders.hpp>
#include <rho/env.hpp>
#include <rho/substitute.hpp>
#include <rho/batch_substitution.hpp>
#include <rho/debug_log.hpp>
#include <algorithm>
#include <iostream>
#include <thread>

using namespace rho;

int main() {
    std::cout << "=== Substitution Basics Example ===\n\n";

    // Example 1: splice a bound value into a parallel composition
    std::cout << "=== Example 1: Splicing ===\n";
    Par value = ParBuilder()
        .add(make_send(quote(make_par(gint(1))), {make_par(gint(42))}))
        .add(make_send(quote(make_par(gint(2))), {}))
        .build();
    Env env = Env::from_indices({{0, value}});

    Par term = ParBuilder()
        .add(evar(bound_var(0)))
        .add(gstring("sibling"))
        .build();

    std::cout << "Term:   " << debug::to_string(term) << "\n";
    std::cout << "Result: " << debug::to_string(substitute(term, env)) << "\n\n";

    // Example 2: binders shift the environment
    std::cout << "=== Example 2: Scoping ===\n";
    Par body = ParBuilder()
        .add(evar(bound_var(0)))
        .add(evar(bound_var(1)))
        .build();
    Par block = make_par(make_new(1, body));

    std::cout << "Term:   " << debug::to_string(block) << "\n";
    std::cout << "Result: " << debug::to_string(substitute(block, env)) << "\n\n";

    // Example 3: canonical form
    std::cout << "=== Example 3: Canonical Form ===\n";
    const Canonicalizer& canonicalizer = default_canonicalizer();
    Par unordered = ParBuilder().add(gint(3)).add(gint(1)).add(gint(2)).build();
    std::cout << "Term:      " << debug::to_string(unordered) << "\n";
    std::cout << "Canonical: " << debug::to_string(canonicalizer.canonicalize(unordered)) << "\n";
    std::cout << "Hash:      " << canonicalizer.hash(unordered) << "\n\n";

    // Example 4: many independent substitutions at once
    std::cout << "=== Example 4: Batch Substitution ===\n";
    debug::set_debug_callback([](const char* message) {
        std::cout << "  log: " << message << "\n";
    });

    std::vector<SubstitutionRequest> requests;
    for (int64_t i = 0; i < 4; ++i) {
        requests.push_back(SubstitutionRequest{
            make_par(make_binary(BinaryOp::Mult, make_par(evar(bound_var(0))), make_par(gint(i)))),
            Env().put(make_par(gint(10)))});
    }
    requests.push_back(SubstitutionRequest{make_par(evar(free_var(0))), Env()});

    const std::size_t num_workers = std::min(4u, std::thread::hardware_concurrency());
    BatchSubstituter batch(num_workers);
    auto outcomes = batch.substitute_all(requests);

    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].ok()) {
            std::cout << "  [" << i << "] " << debug::to_string(outcomes[i].term) << "\n";
        } else {
            std::cout << "  [" << i << "] rejected: " << outcomes[i].error << "\n";
        }
    }
    debug::clear_debug_callback();

    return 0;
}
