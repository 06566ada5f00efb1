//////////////////////////////////////////////////////////////////////////////////////
//
// (C) The qasp contributors 2026. All rights reserved.
//
// This is an answer set search for normal logic programs, compiling the stable
// model condition to a reversible oracle and amplifying it on a multithreaded,
// universal quantum register simulation.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#pragma once

#include "encoder.hpp"
#include "oracle.hpp"
#include "sampler.hpp"

#include <atomic>

namespace Qasp {

/**
 * Search settings; defaults may be overridden by environment variables, then by assignment.
 */
struct SearchOptions {
    /// BBHT escalation factor, strictly between 1 and 4/3 (QASP_BBHT_LAMBDA)
    real1_f lambda;
    /// Safety constant "c" of the cumulative iteration budget (QASP_BUDGET_FACTOR)
    unsigned budgetFactor;
    /// Mark only states with an auxiliary search qubit set, so at most half the search space is marked
    bool augment;
    OracleConvention convention;
    /// Total qubit budget of the oracle register (QASP_MAX_QUBITS)
    bitLenInt maxQubits;
    /// 0 for no round budget (QASP_MAX_ROUNDS)
    size_t maxRounds;
    /// 0 for no wall-clock budget (QASP_MAX_WALL_MS)
    int64_t maxWallTimeMs;
    /// 0 to wait on every backend call synchronously (QASP_ROUND_TIMEOUT_MS)
    int64_t roundTimeoutMs;
    /// Consecutive backend errors tolerated before the error is rethrown; timeouts don't count (QASP_BACKEND_RETRIES)
    size_t maxBackendRetries;
    /// Print per-round progress to stdout (QASP_VERBOSE)
    bool isVerbose;
    /// Probability of each atom (in program order) being true in the initial state; empty for the uniform superposition
    std::vector<real1_f> weights;
    EncoderOptions encoder;

    SearchOptions();
};

/**
 * Terminal outcome of a search
 */
enum SearchStatus {
    /// A verified stable model was found.
    SEARCH_SUCCESS = 0,
    /// A budget ran out before a model was found. This does not prove there is none.
    SEARCH_EXHAUSTED,
    /// The marking function is constant false: the program provably has no stable model.
    SEARCH_UNSAT,
    /// Cancelled between rounds
    SEARCH_CANCELLED
};

/**
 * Search state machine
 */
enum SearchState {
    STATE_INIT = 0,
    STATE_ESCALATE,
    STATE_RUN,
    STATE_VERIFY,
    STATE_SUCCESS,
    STATE_EXHAUSTED
};

struct SearchResult {
    SearchStatus status;
    /// The verified stable model, if "status" is SEARCH_SUCCESS
    Assignment model;
    /// Cumulative Grover iterations dispatched, failed rounds included
    bitCapInt iterations;
    /// Cumulative iteration budget
    bitCapInt budget;
    size_t rounds;
    size_t backendCalls;
    size_t failedRounds;
    std::string reason;

    SearchResult()
        : status(SEARCH_EXHAUSTED)
        , iterations(ZERO_BCI)
        , budget(ZERO_BCI)
        , rounds(0U)
        , backendCalls(0U)
        , failedRounds(0U)
    {
    }
};

std::ostream& operator<<(std::ostream& os, const SearchStatus s);

/**
 * Stable model search by amplitude amplification
 *
 * "Run()" is the Boyer-Brassard-Hoyer-Tapp search for an unknown number of marked states: each round draws an
 * iteration count uniformly from [1, ceil(m)], samples the amplified register once, and verifies the decoded
 * candidate classically. On a miss, "m" grows by "lambda" up to the square root of the search space size, until the
 * cumulative iteration count exceeds ceil(pi/4 * sqrt(2^n)) * c for "n" atoms.
 *
 * The control loop is single threaded and synchronous. "Cancel()" may be called from any thread; it takes effect
 * between rounds. A cancelled search object stays cancelled.
 */
class GroverSearch {
protected:
    BackendPtr backend;
    qasp_rand_gen_ptr rand_generator;
    SearchOptions options;
    std::atomic<bool> isCancelled;
    std::atomic<int> state;

    typedef std::chrono::steady_clock clock;

    void SetState(SearchState s) { state = (int)s; }
    bool Prepare(const Program& program, BoolCircuitPtr& f, SearchResult& result);
    bool IsOutOfBudget(const clock::time_point& start, SearchResult& result);
    bool TrySample(Sampler& sampler, QCircuitPtr circuit, const std::vector<bitLenInt>& measured,
        size_t& consecutiveFailures, bitCapInt& sample, SearchResult& result);
    bool Verify(const Program& program, const bitCapInt& sample, SearchResult& result);
    QCircuitPtr Preparation(const OracleLayout& layout);

public:
    /**
     * "rgp" drives the iteration count draws. If it is null, a generator is seeded from std::random_device.
     */
    GroverSearch(BackendPtr b, qasp_rand_gen_ptr rgp = nullptr, const SearchOptions& opts = SearchOptions());

    /**
     * Search for a stable model of "program," with an unknown number of stable models.
     *
     * Throws UnsupportedConstructError for programs that are not normal, SynthesisResourceError if the oracle
     * exceeds the qubit budget (before any backend call), and BackendExecutionError if more than
     * "maxBackendRetries" consecutive rounds fail on a backend error. Timed out rounds count as failed rounds only.
     */
    SearchResult Run(const Program& program);

    /**
     * Search for a stable model of "program," given that it has exactly "modelCount" stable models.
     *
     * Every round uses the optimal fixed iteration count, which presumes the uniform superposition, so "weights" is
     * not applied here. Rounds repeat until a model is verified or a budget runs out. Throws std::invalid_argument if
     * "modelCount" is 0 or exceeds the number of assignments.
     */
    SearchResult RunKnownCount(const Program& program, const bitCapInt& modelCount);

    void Cancel() { isCancelled = true; }
    bool IsCancelled() const { return isCancelled; }
    SearchState GetState() const { return (SearchState)state.load(); }
    const SearchOptions& GetOptions() const { return options; }

    /**
     * Walsh-Hadamard preparation of the uniform superposition over "qubits"
     */
    static QCircuitPtr UniformPreparation(const std::vector<bitLenInt>& qubits);

    /**
     * Product state preparation in which "qubits[i]" reads 1 with probability "weights[i]," by one RY rotation per
     * qubit. Throws std::invalid_argument if the lengths differ or a weight is outside [0, 1].
     */
    static QCircuitPtr WeightedPreparation(const std::vector<bitLenInt>& qubits, const std::vector<real1_f>& weights);

    /**
     * Append the reflection about A|0> to "circuit," up to global phase, as A^dagger, then the reflection about |0>
     * on "qubits," then A, for the preparation circuit A. A null "preparation" is the uniform superposition.
     */
    static void Diffusion(
        QCircuitPtr circuit, const std::vector<bitLenInt>& qubits, QCircuitPtr preparation = nullptr);

    /**
     * Build a circuit that applies "preparation" (by default, the uniform superposition) to the oracle's search
     * register, then "iterations" amplitude amplification iterations about it.
     */
    static QCircuitPtr GroverCircuit(
        const Oracle& oracle, const bitCapInt& iterations, QCircuitPtr preparation = nullptr);

    /**
     * Optimal fixed iteration count for "modelCount" marked states out of 2^"searchQubits"
     */
    static bitCapInt OptimalIterations(const bitCapInt& modelCount, bitLenInt searchQubits);

    /**
     * Cumulative iteration budget ceil(pi/4 * sqrt(2^"atomCount")) * "factor"
     */
    static bitCapInt IterationBudget(bitLenInt atomCount, unsigned factor);
};

} // namespace Qasp
