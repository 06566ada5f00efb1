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

#include "amplification.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace Qasp {

SearchOptions::SearchOptions()
    : lambda((real1_f)1.2f)
    , budgetFactor(8U)
    , augment(true)
    , convention(PHASE_ORACLE)
    , maxQubits(24U)
    , maxRounds(0U)
    , maxWallTimeMs(0)
    , roundTimeoutMs(0)
    , maxBackendRetries(3U)
    , isVerbose(false)
{
#if ENABLE_ENV_VARS
    if (getenv("QASP_BBHT_LAMBDA")) {
        lambda = (real1_f)std::stod(std::string(getenv("QASP_BBHT_LAMBDA")));
    }
    if (getenv("QASP_BUDGET_FACTOR")) {
        const int c = std::stoi(std::string(getenv("QASP_BUDGET_FACTOR")));
        if (c < 1) {
            throw std::invalid_argument("QASP_BUDGET_FACTOR must be a positive integer!");
        }
        budgetFactor = (unsigned)c;
    }
    if (getenv("QASP_MAX_QUBITS")) {
        const int q = std::stoi(std::string(getenv("QASP_MAX_QUBITS")));
        if ((q < 1) || (q >= (int)bitsInCap)) {
            throw std::invalid_argument(
                "QASP_MAX_QUBITS must be between 1 and " + std::to_string((int)bitsInCap - 1) + "!");
        }
        maxQubits = (bitLenInt)q;
    }
    if (getenv("QASP_MAX_ROUNDS")) {
        maxRounds = (size_t)std::stoull(std::string(getenv("QASP_MAX_ROUNDS")));
    }
    if (getenv("QASP_MAX_WALL_MS")) {
        maxWallTimeMs = (int64_t)std::stoll(std::string(getenv("QASP_MAX_WALL_MS")));
    }
    if (getenv("QASP_ROUND_TIMEOUT_MS")) {
        roundTimeoutMs = (int64_t)std::stoll(std::string(getenv("QASP_ROUND_TIMEOUT_MS")));
    }
    if (getenv("QASP_BACKEND_RETRIES")) {
        maxBackendRetries = (size_t)std::stoull(std::string(getenv("QASP_BACKEND_RETRIES")));
    }
    isVerbose = (bool)getenv("QASP_VERBOSE");
#endif

    if ((lambda <= ONE_R1_F) || (lambda >= ((real1_f)4.0f / 3))) {
        throw std::invalid_argument("SearchOptions lambda must be greater than 1 and less than 4/3!");
    }
}

std::ostream& operator<<(std::ostream& os, const SearchStatus s)
{
    switch (s) {
    case SEARCH_SUCCESS:
        return os << "SUCCESS";
    case SEARCH_EXHAUSTED:
        return os << "EXHAUSTED";
    case SEARCH_UNSAT:
        return os << "UNSAT";
    case SEARCH_CANCELLED:
        return os << "CANCELLED";
    }

    return os << "UNKNOWN";
}

GroverSearch::GroverSearch(BackendPtr b, qasp_rand_gen_ptr rgp, const SearchOptions& opts)
    : backend(b)
    , rand_generator(rgp)
    , options(opts)
    , isCancelled(false)
    , state((int)STATE_INIT)
{
    if (!backend) {
        throw std::invalid_argument("GroverSearch requires a backend!");
    }
    if ((options.lambda <= ONE_R1_F) || (options.lambda >= ((real1_f)4.0f / 3))) {
        throw std::invalid_argument("GroverSearch lambda must be greater than 1 and less than 4/3!");
    }
    if (!options.budgetFactor) {
        throw std::invalid_argument("GroverSearch budget factor must be positive!");
    }

    if (!rand_generator) {
        rand_generator = std::make_shared<qasp_rand_gen>();
        std::random_device rd;
        rand_generator->seed(((uint64_t)rd() << 32U) | (uint64_t)rd());
    }
}

QCircuitPtr GroverSearch::UniformPreparation(const std::vector<bitLenInt>& qubits)
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    for (const bitLenInt& q : qubits) {
        circuit->H(q);
    }

    return circuit;
}

QCircuitPtr GroverSearch::WeightedPreparation(const std::vector<bitLenInt>& qubits, const std::vector<real1_f>& weights)
{
    if (qubits.size() != weights.size()) {
        throw std::invalid_argument("GroverSearch::WeightedPreparation() needs exactly one weight per qubit!");
    }

    QCircuitPtr circuit = std::make_shared<QCircuit>();
    for (size_t i = 0U; i < qubits.size(); ++i) {
        const real1_f w = weights[i];
        if ((w < ZERO_R1_F) || (w > ONE_R1_F)) {
            throw std::invalid_argument("GroverSearch::WeightedPreparation() weights must lie in [0, 1]!");
        }

        // RY(2 * acos(sqrt(1 - w))) takes |0> to sqrt(1 - w)|0> + sqrt(w)|1>.
        const real1 c = (real1)std::sqrt(ONE_R1_F - w);
        const real1 sn = (real1)std::sqrt(w);
        const complex mtrx[4U]{ complex(c, ZERO_R1), complex(-sn, ZERO_R1), complex(sn, ZERO_R1),
            complex(c, ZERO_R1) };
        circuit->UCMtrx(std::set<bitLenInt>(), mtrx, qubits[i], ZERO_BCI);
    }

    return circuit;
}

void GroverSearch::Diffusion(QCircuitPtr circuit, const std::vector<bitLenInt>& qubits, QCircuitPtr preparation)
{
    if (qubits.empty()) {
        return;
    }

    if (!preparation) {
        preparation = UniformPreparation(qubits);
    }

    circuit->Append(preparation->Inverse());

    for (const bitLenInt& q : qubits) {
        circuit->X(q);
    }
    const bitLenInt target = qubits.back();
    const std::set<bitLenInt> controls(qubits.begin(), qubits.end() - 1U);
    circuit->UCZ(controls, pow2Mask((bitLenInt)controls.size()), target);
    for (const bitLenInt& q : qubits) {
        circuit->X(q);
    }

    circuit->Append(preparation);
}

QCircuitPtr GroverSearch::GroverCircuit(const Oracle& oracle, const bitCapInt& iterations, QCircuitPtr preparation)
{
    const std::vector<bitLenInt> search = oracle.layout.SearchQubits();
    const bool isFlip = (oracle.convention == BIT_FLIP_ORACLE);

    if (!preparation) {
        preparation = UniformPreparation(search);
    }

    QCircuitPtr circuit = std::make_shared<QCircuit>();

    // The bit-flip oracle kicks its phase back from an output qubit held in |->.
    if (isFlip) {
        circuit->X(oracle.layout.outputQubit);
        circuit->H(oracle.layout.outputQubit);
    }
    circuit->Append(preparation);

    QCircuitPtr diffusion = std::make_shared<QCircuit>();
    Diffusion(diffusion, search, preparation);

    for (bitCapInt i = ZERO_BCI; i < iterations; ++i) {
        circuit->Append(oracle.circuit);
        circuit->Append(diffusion);
    }

    if (isFlip) {
        circuit->H(oracle.layout.outputQubit);
        circuit->X(oracle.layout.outputQubit);
    }

    circuit->SetQubitCount(oracle.layout.qubitCount);

    return circuit;
}

QCircuitPtr GroverSearch::Preparation(const OracleLayout& layout)
{
    if (options.weights.empty()) {
        return UniformPreparation(layout.SearchQubits());
    }
    if (options.weights.size() != layout.atomCount) {
        throw std::invalid_argument("SearchOptions weights must hold one probability per atom!");
    }

    std::vector<bitLenInt> atoms(layout.atomCount);
    for (bitLenInt i = 0U; i < layout.atomCount; ++i) {
        atoms[i] = i;
    }
    QCircuitPtr circuit = WeightedPreparation(atoms, options.weights);
    // The auxiliary qubit still halves the marked fraction.
    if (layout.hasAux) {
        circuit->H(layout.auxQubit);
    }

    return circuit;
}

bitCapInt GroverSearch::OptimalIterations(const bitCapInt& modelCount, bitLenInt searchQubits)
{
    if (!modelCount) {
        throw std::invalid_argument("GroverSearch::OptimalIterations() requires at least one marked state!");
    }
    if (bi_compare(modelCount, pow2(searchQubits)) > 0) {
        throw std::invalid_argument("GroverSearch::OptimalIterations() marked state count exceeds search space!");
    }

    const double amp = std::sqrt((double)modelCount / std::pow(2.0, (double)searchQubits));

    return (bitCapInt)std::round(std::acos(amp) / (2 * std::asin(amp)));
}

bitCapInt GroverSearch::IterationBudget(bitLenInt atomCount, unsigned factor)
{
    return (bitCapInt)std::ceil((PI_R1 / 4) * std::sqrt(std::pow(2.0, (double)atomCount))) * (bitCapInt)factor;
}

bool GroverSearch::Prepare(const Program& program, BoolCircuitPtr& f, SearchResult& result)
{
    SetState(STATE_INIT);

    const bitLenInt n = (bitLenInt)program.GetAtomCount();
    result.budget = IterationBudget(n, options.budgetFactor);

    StableModelEncoder encoder(options.encoder);
    f = encoder.Encode(program);

    if (options.isVerbose) {
        std::cout << "Encoded " << (int)n << " atoms, " << encoder.GetDecidedCount() << " decided, "
                  << encoder.GetLoopCount() << " loop formulas; budget " << result.budget << " iterations"
                  << std::endl;
    }

    bool value;
    if (!f->IsConstant(&value)) {
        return false;
    }

    if (!value) {
        SetState(STATE_EXHAUSTED);
        result.status = SEARCH_UNSAT;
        result.reason = "marking function is constant false";
        return true;
    }

    // Every assignment is marked, so the all-false one is checked directly.
    SetState(STATE_VERIFY);
    if (!Verify(program, ZERO_BCI, result)) {
        SetState(STATE_EXHAUSTED);
        result.status = SEARCH_EXHAUSTED;
        result.reason = "constant true marking function rejected by verification";
    }

    return true;
}

bool GroverSearch::IsOutOfBudget(const clock::time_point& start, SearchResult& result)
{
    if (isCancelled) {
        SetState(STATE_EXHAUSTED);
        result.status = SEARCH_CANCELLED;
        result.reason = "cancelled";
        return true;
    }

    if (result.iterations > result.budget) {
        result.reason = "no stable model found within iteration budget";
    } else if (options.maxRounds && (result.rounds >= options.maxRounds)) {
        result.reason = "no stable model found within round budget";
    } else if ((options.maxWallTimeMs > 0) &&
        (std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count() >=
            options.maxWallTimeMs)) {
        result.reason = "no stable model found within wall-clock budget";
    } else {
        return false;
    }

    SetState(STATE_EXHAUSTED);
    result.status = SEARCH_EXHAUSTED;

    return true;
}

bool GroverSearch::TrySample(Sampler& sampler, QCircuitPtr circuit, const std::vector<bitLenInt>& measured,
    size_t& consecutiveFailures, bitCapInt& sample, SearchResult& result)
{
    ++result.rounds;
    try {
        sample = sampler.Sample(circuit, measured);
    } catch (const BackendTimeoutError& e) {
        // A slow backend is bounded by the search budgets, not by the retry cap.
        result.backendCalls = sampler.GetCallCount();
        ++result.failedRounds;
        if (options.isVerbose) {
            std::cout << "Round " << result.rounds << " timed out: " << e.what() << std::endl;
        }
        return false;
    } catch (const BackendExecutionError& e) {
        result.backendCalls = sampler.GetCallCount();
        ++result.failedRounds;
        ++consecutiveFailures;
        if (options.isVerbose) {
            std::cout << "Round " << result.rounds << " failed: " << e.what() << std::endl;
        }
        if (consecutiveFailures > options.maxBackendRetries) {
            SetState(STATE_EXHAUSTED);
            throw;
        }
        return false;
    }
    result.backendCalls = sampler.GetCallCount();
    consecutiveFailures = 0U;

    return true;
}

bool GroverSearch::Verify(const Program& program, const bitCapInt& sample, SearchResult& result)
{
    const Assignment candidate = Sampler::Decode(program, sample);
    if (options.isVerbose) {
        std::cout << "Candidate " << program.Format(candidate) << std::endl;
    }
    if (!program.IsStableModel(candidate)) {
        return false;
    }

    SetState(STATE_SUCCESS);
    result.status = SEARCH_SUCCESS;
    result.model = candidate;
    result.reason = "verified stable model";

    return true;
}

SearchResult GroverSearch::Run(const Program& program)
{
    SearchResult result;
    BoolCircuitPtr f;
    if (Prepare(program, f, result)) {
        return result;
    }

    OracleSynthesizer synthesizer(options.convention, options.maxQubits, options.augment);
    const OraclePtr oracle = synthesizer.Synthesize(*f);
    const QCircuitPtr preparation = Preparation(oracle->layout);
    const bitLenInt n = (bitLenInt)program.GetAtomCount();
    std::vector<bitLenInt> measured(n);
    for (bitLenInt i = 0U; i < n; ++i) {
        measured[i] = i;
    }

    // Past sqrt(N) iterations, a uniform draw gains nothing.
    const real1_f mMax = (real1_f)std::sqrt(std::pow(2.0, (double)oracle->layout.SearchQubits().size()));
    real1_f m = ONE_R1_F;
    size_t consecutiveFailures = 0U;
    Sampler sampler(backend, options.roundTimeoutMs);
    const clock::time_point start = clock::now();

    while (!IsOutOfBudget(start, result)) {
        SetState(STATE_ESCALATE);
        std::uniform_int_distribution<bitCapInt> draw(ONE_BCI, (bitCapInt)std::ceil(m));
        const bitCapInt j = draw(*rand_generator);

        SetState(STATE_RUN);
        result.iterations += j;
        if (options.isVerbose) {
            std::cout << "Round " << (result.rounds + 1U) << ": " << j << " iterations (m = " << m << ", "
                      << result.iterations << " of " << result.budget << ")" << std::endl;
        }

        bitCapInt sample;
        if (TrySample(sampler, GroverCircuit(*oracle, j, preparation), measured, consecutiveFailures, sample, result)) {
            SetState(STATE_VERIFY);
            if (Verify(program, sample, result)) {
                return result;
            }
        }

        m = std::min(m * options.lambda, mMax);
    }

    if (options.isVerbose) {
        std::cout << "Search " << result.status << ": " << result.reason << std::endl;
    }

    return result;
}

SearchResult GroverSearch::RunKnownCount(const Program& program, const bitCapInt& modelCount)
{
    const bitLenInt n = (bitLenInt)program.GetAtomCount();
    if (!modelCount || (bi_compare(modelCount, pow2(n)) > 0)) {
        throw std::invalid_argument("GroverSearch::RunKnownCount() stable model count must be between 1 and 2^n!");
    }

    SearchResult result;
    BoolCircuitPtr f;
    if (Prepare(program, f, result)) {
        return result;
    }

    // Beyond half the space marked, add the auxiliary qubit to halve the marked fraction.
    const bool useAux = bi_compare(modelCount << 1U, pow2(n)) > 0;
    OracleSynthesizer synthesizer(options.convention, options.maxQubits, useAux);
    const OraclePtr oracle = synthesizer.Synthesize(*f);
    std::vector<bitLenInt> measured(n);
    for (bitLenInt i = 0U; i < n; ++i) {
        measured[i] = i;
    }

    const bitCapInt k = OptimalIterations(modelCount, (bitLenInt)oracle->layout.SearchQubits().size());
    const QCircuitPtr circuit = GroverCircuit(*oracle, k);
    size_t consecutiveFailures = 0U;
    Sampler sampler(backend, options.roundTimeoutMs);
    const clock::time_point start = clock::now();

    if (options.isVerbose) {
        std::cout << "Known count " << modelCount << ": " << k << " iterations per round" << std::endl;
    }

    while (!IsOutOfBudget(start, result)) {
        SetState(STATE_RUN);
        result.iterations += (k ? k : ONE_BCI);

        bitCapInt sample;
        if (TrySample(sampler, circuit, measured, consecutiveFailures, sample, result)) {
            SetState(STATE_VERIFY);
            if (Verify(program, sample, result)) {
                return result;
            }
        }
    }

    if (options.isVerbose) {
        std::cout << "Search " << result.status << ": " << result.reason << std::endl;
    }

    return result;
}

} // namespace Qasp
