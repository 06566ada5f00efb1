//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
// (C) The qasp contributors 2026. All rights reserved.
//
// This is an answer set search for normal logic programs, compiling the stable
// model condition to a reversible oracle and amplifying it on a multithreaded,
// universal quantum register simulation.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#include <atomic>
#include <cmath>
#include <iostream>
#include <list>
#include <stdio.h>
#include <stdlib.h>

#include "tests.hpp"

using namespace Qasp;

#define EPSILON 0.01f
#define REQUIRE_FLOAT(A, B)                                                                                            \
    do {                                                                                                               \
        real1_f __tmp_a = A;                                                                                           \
        real1_f __tmp_b = B;                                                                                           \
        REQUIRE(__tmp_a < (__tmp_b + EPSILON));                                                                        \
        REQUIRE(__tmp_a > (__tmp_b - EPSILON));                                                                        \
    } while (0);
#define REQUIRE_CMPLX(A, B)                                                                                            \
    do {                                                                                                               \
        complex __tmp_a = A;                                                                                           \
        complex __tmp_b = B;                                                                                           \
        REQUIRE(std::norm(__tmp_a - __tmp_b) < EPSILON);                                                               \
    } while (0);

#define C_SQRT1_2 complex(SQRT1_2_R1, ZERO_R1)

// Unique stable model {p, r}, with nothing decided before search.
#define UNIQUE_MODEL_PROGRAM "p :- not q. q :- not p. :- q. r :- p."

qasp_rand_gen_ptr SeededGen(uint64_t seed)
{
    qasp_rand_gen_ptr toRet = std::make_shared<qasp_rand_gen>();
    toRet->seed(seed);
    return toRet;
}

SearchOptions TestOptions()
{
    SearchOptions opts;
    opts.lambda = (real1_f)1.2f;
    opts.budgetFactor = 8U;
    opts.augment = true;
    opts.convention = PHASE_ORACLE;
    opts.maxQubits = max_qubits;
    opts.maxRounds = 0U;
    opts.maxWallTimeMs = 0;
    opts.roundTimeoutMs = 0;
    opts.maxBackendRetries = 3U;
    opts.isVerbose = false;

    return opts;
}

// Stability by minimality over subsets, independent of the reduct fixpoint in Program::IsStableModel().
bool IsStableBySubsets(const Program& p, const Assignment& x)
{
    const std::vector<Rule>& rules = p.GetRules();

    for (const Rule& r : rules) {
        if ((r.kind == RULE_CONSTRAINT) && r.IsBodyTrue(x)) {
            return false;
        }
    }

    const auto isReductModel = [&rules, &x](const Assignment& y) {
        for (const Rule& r : rules) {
            if (r.kind != RULE_NORMAL) {
                continue;
            }
            bool isBlocked = false;
            for (const AtomId& n : r.negative) {
                isBlocked |= x[n];
            }
            bool isBodyTrue = !isBlocked;
            for (const AtomId& a : r.positive) {
                isBodyTrue &= y[a];
            }
            if (isBodyTrue && !y[r.head[0U]]) {
                return false;
            }
        }
        return true;
    };

    if (!isReductModel(x)) {
        return false;
    }

    std::vector<AtomId> trueAtoms;
    for (AtomId a = 0U; a < x.size(); ++a) {
        if (x[a]) {
            trueAtoms.push_back(a);
        }
    }

    // No proper subset of "x" may model the reduct.
    const bitCapIntOcl subsetCount = pow2Ocl((bitLenInt)trueAtoms.size());
    for (bitCapIntOcl mask = 0U; (mask + 1U) < subsetCount; ++mask) {
        Assignment y(x.size(), false);
        for (size_t i = 0U; i < trueAtoms.size(); ++i) {
            y[trueAtoms[i]] = (mask >> i) & 1U;
        }
        if (isReductModel(y)) {
            return false;
        }
    }

    return true;
}

ProgramPtr RandomProgram(qasp_rand_gen& gen, size_t atomCount, size_t ruleCount)
{
    std::vector<std::string> names;
    for (size_t i = 0U; i < atomCount; ++i) {
        names.push_back("a" + std::to_string(i));
    }

    std::uniform_int_distribution<size_t> atomDist(0U, atomCount - 1U);
    std::uniform_int_distribution<size_t> lengthDist(0U, 2U);
    std::bernoulli_distribution constraintDist(0.1);

    std::vector<RuleInput> rules;
    for (size_t r = 0U; r < ruleCount; ++r) {
        std::vector<std::string> pos, neg;
        const size_t posCount = lengthDist(gen);
        for (size_t i = 0U; i < posCount; ++i) {
            pos.push_back(names[atomDist(gen)]);
        }
        const size_t negCount = lengthDist(gen);
        for (size_t i = 0U; i < negCount; ++i) {
            neg.push_back(names[atomDist(gen)]);
        }

        if (constraintDist(gen) && (posCount || negCount)) {
            rules.push_back(RuleInput::Constraint(pos, neg));
        } else {
            rules.push_back(RuleInput::Normal(names[atomDist(gen)], pos, neg));
        }
    }

    return Program::Build(rules, names);
}

#if UINTPOW > 3
TEST_CASE("test_qengine_cpu_par_for")
{
    QEngineCPUPtr qengine = std::make_shared<QEngineCPU>(1, ZERO_BCI);

    const int NUM_ENTRIES = 2000;
    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    calls.store(0);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    qengine->par_for(0, NUM_ENTRIES, [&](const bitCapIntOcl lcv, const unsigned cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        calls++;
    });

    REQUIRE(calls.load() == NUM_ENTRIES);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        REQUIRE(hit[i].load() == true);
    }
}

TEST_CASE("test_qengine_cpu_par_for_skip")
{
    QEngineCPUPtr qengine = std::make_shared<QEngineCPU>(1, ZERO_BCI);

    const int NUM_ENTRIES = 2000;
    const int NUM_CALLS = 1000;

    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    calls.store(0);

    int skipBit = 0x4; // Skip 0b100 when counting upwards.

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    qengine->par_for_skip(0, NUM_ENTRIES, 4, 1, [&](const bitCapIntOcl lcv, const unsigned cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        REQUIRE((lcv & skipBit) == 0);

        calls++;
    });

    REQUIRE(calls.load() == NUM_CALLS);
}

TEST_CASE("test_qengine_cpu_par_for_mask")
{
    QEngineCPUPtr qengine = std::make_shared<QEngineCPU>(1, ZERO_BCI);

    const int NUM_ENTRIES = 2000;

    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    const std::vector<bitCapIntOcl> skipArray{ 0x4, 0x100 }; // Skip bits 0b100000100
    int NUM_SKIP = skipArray.size();

    calls.store(0);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    qengine->SetConcurrencyLevel(1);

    qengine->par_for_mask(0, NUM_ENTRIES, skipArray, [&](const bitCapIntOcl lcv, const unsigned cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        for (int i = 0; i < NUM_SKIP; i++) {
            REQUIRE((lcv & skipArray[i]) == 0);
        }
        calls++;
    });
}
#endif

TEST_CASE_METHOD(QInterfaceTestFixture, "test_qengine_getmaxqpower")
{
    // Assuming default engine has 20 qubits:
    REQUIRE(((bitCapIntOcl)qftReg->GetMaxQPower() == 1048576U));
}

TEST_CASE_METHOD(QInterfaceTestFixture, "test_global_phase")
{
    qftReg = std::make_shared<QEngineCPU>(1U, ZERO_BCI, rng, ONE_CMPLX);
    qftReg->Z(0);
    qftReg->X(0);
    qftReg->Z(0);
    qftReg->X(0);
    REQUIRE_FLOAT(-ONE_R1_F, (real1_f)real(qftReg->GetAmplitude(0x00)));
}

TEST_CASE_METHOD(QInterfaceTestFixture, "test_ucmtrx")
{
    const complex pauliX[4] = { ZERO_CMPLX, ONE_CMPLX, ONE_CMPLX, ZERO_CMPLX };
    const std::vector<bitLenInt> controls{ 0, 1 };

    qftReg->SetPermutation(0x00);
    qftReg->UCMtrx(controls, pauliX, 2, ZERO_BCI);
    REQUIRE_THAT(qftReg, HasProbability(0x04));

    qftReg->SetPermutation(0x01);
    qftReg->UCMtrx(controls, pauliX, 2, ONE_BCI);
    REQUIRE_THAT(qftReg, HasProbability(0x05));

    qftReg->SetPermutation(0x02);
    qftReg->UCMtrx(controls, pauliX, 2, 2U);
    REQUIRE_THAT(qftReg, HasProbability(0x06));

    qftReg->SetPermutation(0x03);
    qftReg->UCMtrx(controls, pauliX, 2, 3U);
    REQUIRE_THAT(qftReg, HasProbability(0x07));

    qftReg->SetPermutation(0x00);
    qftReg->UCMtrx(controls, pauliX, 2, ONE_BCI);
    REQUIRE_THAT(qftReg, HasProbability(0x00));

    qftReg->SetPermutation(0x03);
    qftReg->UCMtrx(controls, pauliX, 2, ZERO_BCI);
    REQUIRE_THAT(qftReg, HasProbability(0x03));
}

TEST_CASE_METHOD(QInterfaceTestFixture, "test_ccnot")
{
    const std::vector<bitLenInt> controls{ 0, 1 };

    qftReg->SetPermutation(0x03);
    qftReg->H(0, 3);
    qftReg->MCX(controls, 2);
    qftReg->H(2);
    qftReg->MCPhase(controls, ONE_CMPLX, -ONE_CMPLX, 2);
    qftReg->H(0, 2);
    REQUIRE_THAT(qftReg, HasProbability(0x03));

    qftReg->SetPermutation(0x1000);
    qftReg->MCX({ 12 }, 11);
    REQUIRE_THAT(qftReg, HasProbability(0x1800));
}

TEST_CASE_METHOD(QInterfaceTestFixture, "test_multishot_measure_mask")
{
    qftReg->SetPermutation(0x05);
    qftReg->H(3);

    const std::vector<bitCapInt> qPowers{ pow2(0U), pow2(1U), pow2(3U) };
    const std::map<bitCapInt, int> results = qftReg->MultiShotMeasureMask(qPowers, 1000U);

    // Qubit 0 is always set, qubit 1 never, and qubit 3 about half the time.
    int total = 0;
    for (const auto& r : results) {
        REQUIRE(((r.first == 0x01U) || (r.first == 0x05U)));
        total += r.second;
    }
    REQUIRE(total == 1000);
    REQUIRE(results.size() == 2U);

    // Sampling does not collapse the state.
    REQUIRE_FLOAT((real1_f)qftReg->Prob(3), (real1_f)0.5f);
}

TEST_CASE("test_qcircuit_inverse")
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    circuit->H(0);
    circuit->UCX({ 0 }, ONE_BCI, 1);
    circuit->UCX({ 0, 1 }, ONE_BCI, 2);
    circuit->Z(1);
    circuit->H(2);

    QInterfacePtr qsim = std::make_shared<QEngineCPU>(3U, 0x02, rng, ONE_CMPLX);
    circuit->Run(qsim);
    circuit->Inverse()->Run(qsim);

    REQUIRE_CMPLX(qsim->GetAmplitude(0x02), ONE_CMPLX);
}

TEST_CASE("test_qcircuit_cancellation")
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    circuit->UCX({ 0, 1 }, 2U, 2);
    circuit->X(3);
    circuit->UCX({ 0, 1 }, 2U, 2);
    REQUIRE(circuit->GetGateCount() == 1U);

    circuit->H(3);
    circuit->H(3);
    circuit->X(3);
    REQUIRE(circuit->GetGateCount() == 0U);
    REQUIRE(circuit->GetQubitCount() == 4U);
}

TEST_CASE("test_qcircuit_serialization")
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    circuit->H(0);
    circuit->H(1);
    circuit->UCX({ 0, 1 }, ONE_BCI, 2);
    circuit->UCZ({ 2 }, ZERO_BCI, 0);

    std::stringstream ss;
    ss << circuit;
    QCircuitPtr readBack = std::make_shared<QCircuit>();
    ss >> readBack;

    REQUIRE(readBack->GetQubitCount() == circuit->GetQubitCount());
    REQUIRE(readBack->GetGateCount() == circuit->GetGateCount());

    QInterfacePtr expected = std::make_shared<QEngineCPU>(3U, ZERO_BCI, rng, ONE_CMPLX);
    QInterfacePtr actual = std::make_shared<QEngineCPU>(3U, ZERO_BCI, rng, ONE_CMPLX);
    circuit->Run(expected);
    readBack->Run(actual);
    for (bitCapInt i = ZERO_BCI; i < expected->GetMaxQPower(); ++i) {
        REQUIRE_CMPLX(actual->GetAmplitude(i), expected->GetAmplitude(i));
    }
}

TEST_CASE("test_parse_program")
{
    ProgramPtr p = ParseProgram("% facts first\n"
                                "a.\n"
                                "b :- not a.\n"
                                "c :- a,\n"
                                "     not b.   % multi-line body\n"
                                ":- b, c.\n"
                                "d(1, x) :- c.");

    REQUIRE(p->GetAtomCount() == 4U);
    REQUIRE(p->GetAtomName(0U) == "a");
    REQUIRE(p->GetAtomName(3U) == "d(1, x)");
    REQUIRE(p->GetRules().size() == 5U);
    REQUIRE(p->GetRules()[3U].kind == RULE_CONSTRAINT);
    REQUIRE(p->GetRules()[2U].negative.size() == 1U);

    AtomId id;
    REQUIRE(p->FindAtom("c", &id));
    REQUIRE(id == 2U);
    REQUIRE(!p->FindAtom("e", &id));

    // The printed program reads back to the same program.
    std::stringstream ss;
    ss << *p;
    ProgramPtr readBack = ParseProgram(ss);
    REQUIRE(readBack->GetAtoms() == p->GetAtoms());
    REQUIRE(readBack->StableModels() == p->StableModels());
}

TEST_CASE("test_parse_program_kinds")
{
    REQUIRE(ParseProgram("a | b :- c.")->GetRules()[0U].kind == RULE_DISJUNCTIVE);
    REQUIRE(ParseProgram("{a; b} :- c.")->GetRules()[0U].kind == RULE_CHOICE);
    REQUIRE(ParseProgram(":- #count{x : a} > 1.")->GetRules()[0U].kind == RULE_AGGREGATE);
    REQUIRE(ParseProgram("a :- .")->GetRules()[0U].kind == RULE_NORMAL);
}

TEST_CASE("test_parse_program_errors")
{
    REQUIRE_THROWS_AS(ParseProgram("a :- b"), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("not a :- b."), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("Abc."), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("a :- b, , c."), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("a :- not not b."), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("a. ."), MalformedProgramError);
    REQUIRE_THROWS_AS(ParseProgram("p(1 :- q."), MalformedProgramError);
}

TEST_CASE("test_program_build_errors")
{
    REQUIRE_THROWS_AS(Program::Build({ RuleInput::Normal("") }), MalformedProgramError);
    REQUIRE_THROWS_AS(Program::Build({ RuleInput(RULE_NORMAL, {}, { "a" }, {}) }), MalformedProgramError);
    REQUIRE_THROWS_AS(
        Program::Build({ RuleInput(RULE_NORMAL, { InputLiteral("a"), InputLiteral("b") }, {}, {}) }),
        MalformedProgramError);
    REQUIRE_THROWS_AS(Program::Build({ RuleInput(RULE_CONSTRAINT, { InputLiteral("a") }, { "b" }, {}) }),
        MalformedProgramError);
    REQUIRE_THROWS_AS(Program::Build({ RuleInput::Normal("a", { "b" }) }, { "a" }), MalformedProgramError);
    REQUIRE_THROWS_AS(Program::Build({ RuleInput::Normal("a") }, { "a", "a" }), MalformedProgramError);

    // Malformed input is rejected before any search starts.
    REQUIRE_THROWS_AS(ParseProgram("a :- not a"), std::invalid_argument);
}

TEST_CASE("test_program_atom_order")
{
    ProgramPtr p = ParseProgram("a :- not b.", { "z", "b", "a" });
    REQUIRE(p->GetAtomCount() == 3U);

    AtomId id;
    REQUIRE(p->FindAtom("a", &id));
    REQUIRE(id == 2U);

    // "z" has no rules, so it is false in every stable model.
    const std::vector<Assignment> models = p->StableModels();
    REQUIRE(models.size() == 1U);
    REQUIRE(models[0U] == Assignment({ false, false, true }));
    REQUIRE(p->Format(models[0U]) == "{a}");
    REQUIRE(p->Encode(models[0U]) == 0x04U);
    REQUIRE(p->Decode(0x04U) == models[0U]);
}

TEST_CASE("test_stable_model_check")
{
    ProgramPtr p = ParseProgram("a. b :- not a.");
    REQUIRE(p->IsStableModel({ true, false }));
    REQUIRE(!p->IsStableModel({ true, true }));
    REQUIRE(!p->IsStableModel({ false, true }));
    REQUIRE(!p->IsStableModel({ false, false }));
    REQUIRE_THROWS_AS(p->IsStableModel({ true }), std::invalid_argument);

    // A positive loop alone supports nothing.
    ProgramPtr loop = ParseProgram("a :- b. b :- a.");
    REQUIRE(loop->IsStableModel({ false, false }));
    REQUIRE(!loop->IsStableModel({ true, true }));

    ProgramPtr even = ParseProgram("p :- not q. q :- not p.");
    REQUIRE(even->StableModels().size() == 2U);

    ProgramPtr odd = ParseProgram("a :- not a.");
    REQUIRE(odd->StableModels().empty());
}

TEST_CASE("test_unsupported_construct")
{
    ProgramPtr p = ParseProgram("a | b :- c. c.");
    StableModelEncoder encoder;
    REQUIRE_THROWS_AS(encoder.Encode(*p), UnsupportedConstructError);
    REQUIRE_THROWS_AS(p->IsStableModel({ false, false, true }), UnsupportedConstructError);

    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(1U)));
    GroverSearch search(backend, SeededGen(2U), TestOptions());
    REQUIRE_THROWS_AS(search.Run(*ParseProgram("{a; b}.")), UnsupportedConstructError);
    REQUIRE_THROWS_AS(search.Run(*ParseProgram("a :- #count{x : b} > 0. b.")), UnsupportedConstructError);
    REQUIRE(backend->GetCalls() == 0U);
}

TEST_CASE("test_dependency_graph")
{
    ProgramPtr p = ParseProgram("a :- b. b :- a. c :- c. d :- a, not e. e :- not d.");
    DependencyGraph graph(p->GetAtomCount(), p->GetRules());

    REQUIRE(!graph.IsTight());
    REQUIRE(graph.GetSccs().size() == 2U);
    REQUIRE(graph.GetScc(0U) == graph.GetScc(1U));
    REQUIRE(graph.GetScc(0U) != graph.GetScc(2U));
    REQUIRE(graph.GetScc(3U) == DependencyGraph::NO_SCC);
    REQUIRE(graph.GetScc(4U) == DependencyGraph::NO_SCC);

    // {a, b} and {c}; neither {a} nor {b} depends on itself.
    REQUIRE(graph.Loops(16U).size() == 2U);
    REQUIRE_THROWS_AS(graph.Loops(1U), SynthesisResourceError);

    ProgramPtr tight = ParseProgram("a :- not b. b :- not a. c :- a.");
    REQUIRE(DependencyGraph(tight->GetAtomCount(), tight->GetRules()).IsTight());
}

TEST_CASE("test_dependency_graph_loops")
{
    // A ring with a chord: every loop must be strongly connected on its own.
    ProgramPtr p = ParseProgram("a :- c. b :- a. c :- b. a :- b.");
    DependencyGraph graph(p->GetAtomCount(), p->GetRules());

    REQUIRE(graph.GetSccs().size() == 1U);
    // {a, b} via the chord, and {a, b, c} via the ring.
    REQUIRE(graph.Loops(16U).size() == 2U);
}

TEST_CASE("test_bool_circuit")
{
    BoolCircuit f(3U);
    const BoolEdge x = f.Input(0U);
    const BoolEdge y = f.Input(1U);
    const BoolEdge z = f.Input(2U);

    REQUIRE(f.And({ x, BoolCircuit::Not(x) }) == BoolCircuit::FALSE_EDGE);
    REQUIRE(f.Or({ x, BoolCircuit::Not(x) }) == BoolCircuit::TRUE_EDGE);
    REQUIRE(f.Or({ y, BoolCircuit::TRUE_EDGE }) == BoolCircuit::TRUE_EDGE);
    REQUIRE(f.And({ y, BoolCircuit::TRUE_EDGE }) == y);
    REQUIRE(f.And({}) == BoolCircuit::TRUE_EDGE);
    REQUIRE(f.Or({}) == BoolCircuit::FALSE_EDGE);

    // Structural hashing, order insensitive
    REQUIRE(f.And({ x, y }) == f.And({ y, x }));
    REQUIRE(f.And({ f.And({ x, y }), z }) == f.And({ x, y, z }));
    REQUIRE_THROWS_AS(f.Input(3U), std::invalid_argument);

    f.SetRoot(f.Or({ f.And({ x, BoolCircuit::Not(y) }), z }));
    bool value;
    REQUIRE(!f.IsConstant(&value));
    REQUIRE(f.Evaluate({ true, false, false }));
    REQUIRE(!f.Evaluate({ true, true, false }));
    REQUIRE(f.Evaluate({ false, true, true }));
    REQUIRE(f.ReachableGates().size() == 2U);

    f.SetRoot(f.And({ z, BoolCircuit::Not(z) }));
    REQUIRE(f.IsConstant(&value));
    REQUIRE(!value);
}

TEST_CASE("test_encoder_equivalence")
{
    qasp_rand_gen gen(*rng);
    EncoderOptions noPropagation;
    noPropagation.doPropagate = false;

    for (int trial = 0; trial < 200; ++trial) {
        const size_t atomCount = 1U + (trial % 5);
        ProgramPtr p = RandomProgram(gen, atomCount, atomCount + (trial % 4));

        StableModelEncoder encoder;
        StableModelEncoder plainEncoder(noPropagation);
        BoolCircuitPtr f = encoder.Encode(*p);
        BoolCircuitPtr g = plainEncoder.Encode(*p);

        for (bitCapInt perm = ZERO_BCI; perm < pow2((bitLenInt)atomCount); ++perm) {
            const Assignment x = p->Decode(perm);
            const bool isStable = IsStableBySubsets(*p, x);
            INFO("program:\n" << *p << "assignment " << p->Format(x));
            REQUIRE(p->IsStableModel(x) == isStable);
            REQUIRE(f->Evaluate(x) == isStable);
            REQUIRE(g->Evaluate(x) == isStable);
        }
    }
}

TEST_CASE("test_encoder_loop_formula")
{
    ProgramPtr p = ParseProgram("a :- b. b :- a. a :- not c. c :- not a.");
    StableModelEncoder encoder;
    BoolCircuitPtr f = encoder.Encode(*p);

    REQUIRE(encoder.GetLoopCount() == 1U);
    REQUIRE(f->Evaluate({ true, true, false }));
    REQUIRE(f->Evaluate({ false, false, true }));
    REQUIRE(!f->Evaluate({ false, false, false }));

    // Completion alone also accepts {a, b} here; only the loop formula rules it out.
    ProgramPtr unfounded = ParseProgram("a :- b. b :- a.");
    f = encoder.Encode(*unfounded);
    REQUIRE(f->Evaluate({ false, false }));
    REQUIRE(!f->Evaluate({ true, true }));

    EncoderOptions small;
    small.maxLoopScc = 1U;
    StableModelEncoder smallEncoder(small);
    REQUIRE_THROWS_AS(smallEncoder.Encode(*p), SynthesisResourceError);
}

TEST_CASE("test_encoder_constant_false")
{
    StableModelEncoder encoder;
    bool value;

    REQUIRE(encoder.Encode(*ParseProgram("a :- not a."))->IsConstant(&value));
    REQUIRE(!value);

    REQUIRE(encoder.Encode(*ParseProgram("a. b :- a. :- b."))->IsConstant(&value));
    REQUIRE(!value);
    REQUIRE(encoder.GetDecidedCount() == 0U);

    REQUIRE(encoder.Encode(*ParseProgram(":- ."))->IsConstant(&value));
    REQUIRE(!value);

    // Facts and unsupported atoms are decided, but still constrain the register.
    BoolCircuitPtr f = encoder.Encode(*ParseProgram("a. b :- not a."));
    REQUIRE(!f->IsConstant());
    REQUIRE(encoder.GetDecidedCount() == 2U);
    REQUIRE(f->Evaluate({ true, false }));
    REQUIRE(!f->Evaluate({ true, true }));

    REQUIRE(encoder.Encode(*Program::Build({}))->IsConstant(&value));
    REQUIRE(value);
}

TEST_CASE("test_oracle_ancilla_hygiene")
{
    ProgramPtr p = ParseProgram("a :- b. b :- a. a :- not c. c :- not a. d :- c, not b.");
    StableModelEncoder encoder;
    BoolCircuitPtr f = encoder.Encode(*p);
    REQUIRE(encoder.GetLoopCount() == 1U);

    const OracleConvention conventions[2]{ PHASE_ORACLE, BIT_FLIP_ORACLE };
    for (const OracleConvention& convention : conventions) {
        for (int augment = 0; augment < 2; ++augment) {
            OracleSynthesizer synthesizer(convention, 24U, augment);
            OraclePtr oracle = synthesizer.Synthesize(*f);
            const OracleLayout& layout = oracle->layout;

            REQUIRE(layout.ancillaCount > 0U);
            REQUIRE(layout.hasOutput == (convention == BIT_FLIP_ORACLE));
            REQUIRE(oracle->circuit->GetQubitCount() == layout.qubitCount);

            const bitLenInt searchBits = layout.atomCount + (layout.hasAux ? 1U : 0U);
            for (bitCapInt perm = ZERO_BCI; perm < pow2(searchBits); ++perm) {
                QInterfacePtr qsim = std::make_shared<QEngineCPU>(layout.qubitCount, perm, rng, ONE_CMPLX);
                oracle->circuit->Run(qsim);

                const bool isMarked =
                    f->Evaluate(p->Decode(perm)) && (!layout.hasAux || bi_and_1(perm >> layout.auxQubit));
                INFO("convention " << (int)convention << ", augment " << augment << ", input " << perm);
                if (convention == BIT_FLIP_ORACLE) {
                    const bitCapInt expected = isMarked ? (perm | pow2(layout.outputQubit)) : perm;
                    REQUIRE_FLOAT((real1_f)qsim->ProbAll(expected), ONE_R1_F);
                } else {
                    REQUIRE_CMPLX(qsim->GetAmplitude(perm), isMarked ? -ONE_CMPLX : ONE_CMPLX);
                }
            }
        }
    }
}

TEST_CASE("test_oracle_budget")
{
    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    BoolCircuitPtr f = StableModelEncoder().Encode(*p);

    OracleSynthesizer tooSmall(PHASE_ORACLE, 4U, true);
    REQUIRE_THROWS_AS(tooSmall.Synthesize(*f), SynthesisResourceError);

    BoolCircuit unsat(1U);
    unsat.SetRoot(BoolCircuit::FALSE_EDGE);
    OracleSynthesizer synthesizer(PHASE_ORACLE, 24U, true);
    REQUIRE_THROWS_AS(synthesizer.Synthesize(unsat), std::invalid_argument);
}

TEST_CASE("test_oracle_round_trip")
{
    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    BoolCircuitPtr f = StableModelEncoder().Encode(*p);
    OraclePtr oracle = OracleSynthesizer(BIT_FLIP_ORACLE, 24U, true).Synthesize(*f);
    const Assignment model = p->StableModels()[0U];

    QCircuitPtr circuit = std::make_shared<QCircuit>();
    for (bitLenInt i = 0U; i < model.size(); ++i) {
        if (model[i]) {
            circuit->X(i);
        }
    }
    circuit->X(oracle->layout.auxQubit);
    circuit->Append(oracle->circuit);

    std::vector<bitLenInt> measured;
    for (bitLenInt i = 0U; i < oracle->layout.atomCount; ++i) {
        measured.push_back(i);
    }
    measured.push_back(oracle->layout.outputQubit);

    Sampler sampler(std::make_shared<SimulatorBackend>(SeededGen(7U)));
    const bitCapInt sample = sampler.Sample(circuit, measured);

    REQUIRE(Sampler::Decode(*p, sample) == model);
    REQUIRE(bi_and_1(sample >> oracle->layout.atomCount) == 1);
    REQUIRE(sampler.GetCallCount() == 1U);
}

TEST_CASE("test_grover_circuit")
{
    // The canonical 8 bit, single target search takes 12 iterations.
    REQUIRE(GroverSearch::OptimalIterations(ONE_BCI, 8U) == 12U);
    REQUIRE(GroverSearch::OptimalIterations(ONE_BCI, 3U) == 2U);
    REQUIRE_THROWS_AS(GroverSearch::OptimalIterations(ZERO_BCI, 3U), std::invalid_argument);
    REQUIRE_THROWS_AS(GroverSearch::OptimalIterations(9U, 3U), std::invalid_argument);
    REQUIRE(GroverSearch::IterationBudget(2U, 8U) == 16U);
    REQUIRE(GroverSearch::IterationBudget(4U, 1U) == 4U);
    REQUIRE(GroverSearch::IterationBudget(0U, 8U) == 8U);

    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    BoolCircuitPtr f = StableModelEncoder().Encode(*p);
    const bitCapInt target = p->Encode(p->StableModels()[0U]);

    const OracleConvention conventions[2]{ PHASE_ORACLE, BIT_FLIP_ORACLE };
    for (const OracleConvention& convention : conventions) {
        OraclePtr oracle = OracleSynthesizer(convention, 24U, false).Synthesize(*f);
        QInterfacePtr qsim = std::make_shared<QEngineCPU>(oracle->layout.qubitCount, ZERO_BCI, rng, ONE_CMPLX);
        GroverSearch::GroverCircuit(*oracle, 2U)->Run(qsim);

        // Ancillas and output end clean, so the whole register sits on the model.
        REQUIRE(qsim->ProbAll(target) > 0.9f);
    }
}

TEST_CASE("test_weighted_preparation")
{
    const std::vector<bitLenInt> qubits{ 0, 1, 2 };
    const std::vector<real1_f> weights{ (real1_f)0.7f, (real1_f)0.2f, (real1_f)0.6f };

    QInterfacePtr qsim = std::make_shared<QEngineCPU>(3U, ZERO_BCI, rng, ONE_CMPLX);
    GroverSearch::WeightedPreparation(qubits, weights)->Run(qsim);
    for (size_t i = 0U; i < qubits.size(); ++i) {
        REQUIRE_FLOAT((real1_f)qsim->Prob(qubits[i]), weights[i]);
    }

    // The uniform preparation is the all-one-half special case.
    qsim->SetPermutation(ZERO_BCI);
    GroverSearch::UniformPreparation(qubits)->Run(qsim);
    REQUIRE_FLOAT((real1_f)qsim->ProbAll(5U), (real1_f)0.125f);

    REQUIRE_THROWS_AS(GroverSearch::WeightedPreparation(qubits, { ONE_R1_F }), std::invalid_argument);
    REQUIRE_THROWS_AS(GroverSearch::WeightedPreparation({ 0 }, { (real1_f)1.5f }), std::invalid_argument);
}

TEST_CASE("test_grover_circuit_weighted")
{
    // {p, r} is the only model. Starting from P(p) = 0.7, P(q) = 0.2, P(r) = 0.6, it is sampled with probability
    // a = 0.336, and one iteration about that start lifts it to sin^2(3 * asin(sqrt(a))) > 0.9.
    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    BoolCircuitPtr f = StableModelEncoder().Encode(*p);
    const bitCapInt target = p->Encode(p->StableModels()[0U]);
    const std::vector<real1_f> weights{ (real1_f)0.7f, (real1_f)0.2f, (real1_f)0.6f };

    const OracleConvention conventions[2]{ PHASE_ORACLE, BIT_FLIP_ORACLE };
    for (const OracleConvention& convention : conventions) {
        OraclePtr oracle = OracleSynthesizer(convention, 24U, false).Synthesize(*f);
        QCircuitPtr preparation = GroverSearch::WeightedPreparation(oracle->layout.SearchQubits(), weights);

        QInterfacePtr qsim = std::make_shared<QEngineCPU>(oracle->layout.qubitCount, ZERO_BCI, rng, ONE_CMPLX);
        GroverSearch::GroverCircuit(*oracle, ZERO_BCI, preparation)->Run(qsim);
        REQUIRE_FLOAT((real1_f)qsim->ProbAll(target), (real1_f)0.336f);

        qsim->SetPermutation(ZERO_BCI);
        GroverSearch::GroverCircuit(*oracle, ONE_BCI, preparation)->Run(qsim);
        REQUIRE(qsim->ProbAll(target) > 0.9f);

        // The uniform start needs more iterations for the same target.
        qsim->SetPermutation(ZERO_BCI);
        GroverSearch::GroverCircuit(*oracle, ONE_BCI)->Run(qsim);
        REQUIRE(qsim->ProbAll(target) < 0.9f);
    }
}

TEST_CASE("test_search_weighted")
{
    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);

    SearchOptions opts = TestOptions();
    opts.weights = { (real1_f)0.7f, (real1_f)0.2f, (real1_f)0.6f };
    GroverSearch search(std::make_shared<SimulatorBackend>(SeededGen(45U)), SeededGen(46U), opts);
    const SearchResult result = search.Run(*p);
    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(p->IsStableModel(result.model));

    opts.weights = { (real1_f)0.5f };
    GroverSearch mismatched(std::make_shared<SimulatorBackend>(SeededGen(47U)), SeededGen(48U), opts);
    REQUIRE_THROWS_AS(mismatched.Run(*p), std::invalid_argument);
}

class FixedBackend : public Backend {
protected:
    std::vector<bitCapInt> samples;

public:
    FixedBackend(const std::vector<bitCapInt>& s)
        : samples(s)
    {
    }

    std::vector<bitCapInt> Execute(QCircuitPtr circuit, const std::vector<bitLenInt>& measured, unsigned shots) override
    {
        return samples;
    }
};

class NonStandardThrowBackend : public Backend {
public:
    std::vector<bitCapInt> Execute(QCircuitPtr circuit, const std::vector<bitLenInt>& measured, unsigned shots) override
    {
        throw 42;
    }
};

TEST_CASE("test_sampler_errors")
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    circuit->H(0);
    const std::vector<bitLenInt> measured{ 0 };

    Sampler good(std::make_shared<FixedBackend>(std::vector<bitCapInt>{ ONE_BCI }));
    REQUIRE(good.Sample(circuit, measured) == ONE_BCI);

    Sampler twoSamples(std::make_shared<FixedBackend>(std::vector<bitCapInt>{ ZERO_BCI, ONE_BCI }));
    REQUIRE_THROWS_AS(twoSamples.Sample(circuit, measured), BackendExecutionError);

    Sampler noSamples(std::make_shared<FixedBackend>(std::vector<bitCapInt>()));
    REQUIRE_THROWS_AS(noSamples.Sample(circuit, measured), BackendExecutionError);

    Sampler wide(std::make_shared<FixedBackend>(std::vector<bitCapInt>{ 2U }));
    REQUIRE_THROWS_AS(wide.Sample(circuit, measured), BackendExecutionError);

    // Foreign exceptions are reported as backend failures.
    Sampler faulty(std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(3U)), std::vector<bool>{ true }));
    REQUIRE_THROWS_AS(faulty.Sample(circuit, measured), BackendExecutionError);
    REQUIRE(faulty.GetCallCount() == 1U);

    // So are exceptions outside the standard hierarchy.
    Sampler odd(std::make_shared<NonStandardThrowBackend>());
    REQUIRE_THROWS_AS(odd.Sample(circuit, measured), BackendExecutionError);
    REQUIRE(odd.GetCallCount() == 1U);

    // The simulator rejects measured qubits outside the circuit.
    Sampler simulator(std::make_shared<SimulatorBackend>(SeededGen(4U)));
    REQUIRE_THROWS_AS(simulator.Sample(circuit, { 0, 1 }), BackendExecutionError);
}

TEST_CASE("test_sampler_timeout")
{
    QCircuitPtr circuit = std::make_shared<QCircuit>();
    circuit->X(0);
    const std::vector<bitLenInt> measured{ 0 };

    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(5U)), std::vector<bool>(), 300);
    Sampler sampler(backend, 20);

    REQUIRE_THROWS_AS(sampler.Sample(circuit, measured), BackendTimeoutError);
    // The abandoned call outlives the next call's deadline, so that call times out without dispatching.
    REQUIRE_THROWS_AS(sampler.Sample(circuit, measured), BackendTimeoutError);
    REQUIRE(backend->GetCalls() == 1U);
    REQUIRE(sampler.GetCallCount() == 1U);

    // Once the abandoned call ends within a round's deadline, that round dispatches normally.
    std::shared_ptr<ScriptedBackend> stalling = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(8U)), std::vector<bool>(), 300, 1U);
    Sampler recovering(stalling, 200);
    REQUIRE_THROWS_AS(recovering.Sample(circuit, measured), BackendTimeoutError);
    REQUIRE(recovering.Sample(circuit, measured) == ONE_BCI);
    REQUIRE(stalling->GetCalls() == 2U);
    REQUIRE(recovering.GetCallCount() == 2U);

    Sampler patient(std::make_shared<ScriptedBackend>(
                        std::make_shared<SimulatorBackend>(SeededGen(6U)), std::vector<bool>(), 20),
        2000);
    REQUIRE(patient.Sample(circuit, measured) == ONE_BCI);
}

TEST_CASE("test_search_facts")
{
    ProgramPtr p = ParseProgram("a. b :- not a.");

    const OracleConvention conventions[2]{ PHASE_ORACLE, BIT_FLIP_ORACLE };
    for (const OracleConvention& convention : conventions) {
        SearchOptions opts = TestOptions();
        opts.convention = convention;
        GroverSearch search(std::make_shared<SimulatorBackend>(SeededGen(11U)), SeededGen(12U), opts);
        REQUIRE(search.GetState() == STATE_INIT);

        const SearchResult result = search.Run(*p);

        REQUIRE(result.status == SEARCH_SUCCESS);
        REQUIRE(result.model == Assignment({ true, false }));
        REQUIRE(search.GetState() == STATE_SUCCESS);
        REQUIRE(result.backendCalls >= 1U);
        REQUIRE(result.backendCalls == result.rounds);
        REQUIRE(result.failedRounds == 0U);
        REQUIRE(result.budget == 16U);
    }
}

TEST_CASE("test_search_trivial")
{
    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(13U)));
    GroverSearch search(backend, SeededGen(14U), TestOptions());

    // No atoms: the empty assignment is the one stable model, and no circuit is needed.
    SearchResult result = search.Run(*Program::Build({}));
    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(result.model.empty());
    REQUIRE(backend->GetCalls() == 0U);

    // One fact: a single marked state in a doubled search space of 4, found by one iteration.
    result = search.Run(*ParseProgram("a."));
    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(result.model == Assignment({ true }));
    REQUIRE(result.rounds == 1U);
    REQUIRE(backend->GetCalls() == 1U);
}

TEST_CASE("test_search_unsat")
{
    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(15U)));
    GroverSearch search(backend, SeededGen(16U), TestOptions());

    const char* programs[3]{ "a :- not a.", "a. b :- a. :- b.", ":- ." };
    for (const char* text : programs) {
        const SearchResult result = search.Run(*ParseProgram(text));
        INFO(text);
        REQUIRE(result.status == SEARCH_UNSAT);
        REQUIRE(result.model.empty());
        REQUIRE(result.rounds == 0U);
        REQUIRE(result.backendCalls == 0U);
        REQUIRE(search.GetState() == STATE_EXHAUSTED);
    }
    REQUIRE(backend->GetCalls() == 0U);
}

TEST_CASE("test_search_exhausted")
{
    // No stable model, but nothing short of search shows it.
    ProgramPtr p = ParseProgram("p :- not q. q :- not p. :- p. :- q.");
    REQUIRE(p->StableModels().empty());

    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(17U)));
    GroverSearch search(backend, SeededGen(18U), TestOptions());
    const SearchResult result = search.Run(*p);

    REQUIRE(result.status == SEARCH_EXHAUSTED);
    REQUIRE(result.model.empty());
    REQUIRE(result.iterations > result.budget);
    REQUIRE(result.budget == 16U);
    REQUIRE(result.rounds > 1U);
    REQUIRE(result.backendCalls == result.rounds);
    REQUIRE(backend->GetCalls() == result.rounds);
    REQUIRE(search.GetState() == STATE_EXHAUSTED);
}

TEST_CASE("test_search_round_budget")
{
    ProgramPtr p = ParseProgram("p :- not q. q :- not p. :- p. :- q.");

    SearchOptions opts = TestOptions();
    opts.maxRounds = 2U;
    GroverSearch search(std::make_shared<SimulatorBackend>(SeededGen(19U)), SeededGen(20U), opts);
    const SearchResult result = search.Run(*p);

    REQUIRE(result.status == SEARCH_EXHAUSTED);
    REQUIRE(result.rounds == 2U);
    REQUIRE(result.reason.find("round") != std::string::npos);
}

TEST_CASE("test_search_flaky_backend")
{
    ProgramPtr p = ParseProgram("p :- not q. q :- not p.");

    // Every other call fails, starting with the first.
    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(21U)), std::vector<bool>{ true, false });
    SearchOptions opts = TestOptions();
    opts.budgetFactor = 64U;
    GroverSearch search(backend, SeededGen(22U), opts);
    const SearchResult result = search.Run(*p);

    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(p->IsStableModel(result.model));
    REQUIRE(result.failedRounds >= 1U);
    REQUIRE(result.failedRounds <= result.rounds);
    REQUIRE(result.backendCalls == result.rounds);
}

TEST_CASE("test_search_retry_cap")
{
    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(23U)), std::vector<bool>{ true });
    SearchOptions opts = TestOptions();
    opts.maxBackendRetries = 2U;
    GroverSearch search(backend, SeededGen(24U), opts);

    REQUIRE_THROWS_AS(search.Run(*ParseProgram(UNIQUE_MODEL_PROGRAM)), BackendExecutionError);
    REQUIRE(backend->GetCalls() == 3U);
}

TEST_CASE("test_search_timeout")
{
    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(25U)), std::vector<bool>(), 300);
    SearchOptions opts = TestOptions();
    opts.roundTimeoutMs = 20;
    opts.maxRounds = 3U;
    GroverSearch search(backend, SeededGen(26U), opts);

    const SearchResult result = search.Run(*ParseProgram(UNIQUE_MODEL_PROGRAM));

    // Timed out rounds count as failed rounds, not as fatal errors.
    REQUIRE(result.status == SEARCH_EXHAUSTED);
    REQUIRE(result.rounds == 3U);
    REQUIRE(result.failedRounds == 3U);
    REQUIRE(backend->GetCalls() == 1U);
}

TEST_CASE("test_search_timeouts_outlast_retry_cap")
{
    // Every call takes far longer than a round, for more rounds than the default retry cap.
    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(41U)), std::vector<bool>(), 300);
    SearchOptions opts = TestOptions();
    opts.roundTimeoutMs = 50;
    opts.maxRounds = 8U;
    REQUIRE(opts.maxBackendRetries == 3U);
    GroverSearch search(backend, SeededGen(42U), opts);

    SearchResult result;
    REQUIRE_NOTHROW(result = search.Run(*ParseProgram(UNIQUE_MODEL_PROGRAM)));

    REQUIRE(result.status == SEARCH_EXHAUSTED);
    REQUIRE(result.rounds == 8U);
    REQUIRE(result.failedRounds == 8U);
    REQUIRE(backend->GetCalls() >= 1U);
    REQUIRE(backend->GetCalls() <= 3U);
}

TEST_CASE("test_search_recovers_after_timeout")
{
    // The first call stalls; later calls are quick.
    std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>(
        std::make_shared<SimulatorBackend>(SeededGen(43U)), std::vector<bool>(), 300, 1U);
    SearchOptions opts = TestOptions();
    opts.roundTimeoutMs = 50;
    opts.budgetFactor = 64U;
    GroverSearch search(backend, SeededGen(44U), opts);

    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    const SearchResult result = search.Run(*p);

    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(p->IsStableModel(result.model));
    REQUIRE(result.failedRounds >= 1U);
    REQUIRE(backend->GetCalls() >= 2U);
}

TEST_CASE("test_search_cancel")
{
    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(27U)));
    GroverSearch search(backend, SeededGen(28U), TestOptions());
    search.Cancel();

    const SearchResult result = search.Run(*ParseProgram(UNIQUE_MODEL_PROGRAM));
    REQUIRE(result.status == SEARCH_CANCELLED);
    REQUIRE(search.IsCancelled());
    REQUIRE(backend->GetCalls() == 0U);
}

TEST_CASE("test_search_resource_errors")
{
    std::shared_ptr<ScriptedBackend> backend =
        std::make_shared<ScriptedBackend>(std::make_shared<SimulatorBackend>(SeededGen(29U)));

    SearchOptions opts = TestOptions();
    opts.maxQubits = 3U;
    GroverSearch search(backend, SeededGen(30U), opts);
    REQUIRE_THROWS_AS(search.Run(*ParseProgram(UNIQUE_MODEL_PROGRAM)), SynthesisResourceError);

    opts = TestOptions();
    opts.encoder.maxLoopScc = 1U;
    GroverSearch loopSearch(backend, SeededGen(31U), opts);
    REQUIRE_THROWS_AS(
        loopSearch.Run(*ParseProgram("a :- b. b :- a. a :- not c. c :- not a.")), SynthesisResourceError);

    REQUIRE(backend->GetCalls() == 0U);
}

TEST_CASE("test_search_options")
{
    BackendPtr backend = std::make_shared<SimulatorBackend>(SeededGen(32U));

    SearchOptions opts = TestOptions();
    opts.lambda = (real1_f)1.5f;
    REQUIRE_THROWS_AS(GroverSearch(backend, nullptr, opts), std::invalid_argument);
    opts.lambda = ONE_R1_F;
    REQUIRE_THROWS_AS(GroverSearch(backend, nullptr, opts), std::invalid_argument);

    opts = TestOptions();
    opts.budgetFactor = 0U;
    REQUIRE_THROWS_AS(GroverSearch(backend, nullptr, opts), std::invalid_argument);

    REQUIRE_THROWS_AS(GroverSearch(nullptr, nullptr, TestOptions()), std::invalid_argument);
}

TEST_CASE("test_search_success_rate")
{
    ProgramPtr p = ParseProgram(UNIQUE_MODEL_PROGRAM);
    const Assignment model = p->StableModels()[0U];

    int successes = 0;
    for (int trial = 0; trial < search_trials; ++trial) {
        const uint64_t seed = (*rng)();
        GroverSearch search(std::make_shared<SimulatorBackend>(SeededGen(seed + 1U)), SeededGen(seed), TestOptions());
        const SearchResult result = search.Run(*p);
        if (result.status == SEARCH_SUCCESS) {
            REQUIRE(result.model == model);
            ++successes;
        }
    }

    std::cout << "Found the stable model in " << successes << " of " << search_trials << " searches." << std::endl;
    REQUIRE(successes >= (int)std::ceil(0.95 * search_trials));
}

TEST_CASE("test_search_known_count")
{
    GroverSearch search(std::make_shared<SimulatorBackend>(SeededGen(33U)), SeededGen(34U), TestOptions());

    ProgramPtr unique = ParseProgram(UNIQUE_MODEL_PROGRAM);
    SearchResult result = search.RunKnownCount(*unique, ONE_BCI);
    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(result.model == unique->StableModels()[0U]);

    ProgramPtr even = ParseProgram("p :- not q. q :- not p.");
    result = search.RunKnownCount(*even, 2U);
    REQUIRE(result.status == SEARCH_SUCCESS);
    REQUIRE(even->IsStableModel(result.model));

    REQUIRE_THROWS_AS(search.RunKnownCount(*even, ZERO_BCI), std::invalid_argument);
    REQUIRE_THROWS_AS(search.RunKnownCount(*even, 5U), std::invalid_argument);

    result = search.RunKnownCount(*ParseProgram("a :- not a."), ONE_BCI);
    REQUIRE(result.status == SEARCH_UNSAT);
}
