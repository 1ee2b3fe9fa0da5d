#include <gtest/gtest.h>
#include "attack/attack.hpp"
#include "constraints/pre_transformation.hpp"
#include "goals/classification.hpp"
#include "transforms/word_swap.hpp"
#include "util/errors.hpp"
#include "test_helpers.hpp"

#include <memory>

using namespace advtext;
using namespace advtext::test_support;

namespace {

std::unique_ptr<GoalFunction> makeGoal(std::shared_ptr<ModelTable> table = std::make_shared<ModelTable>()) {
    return std::make_unique<UntargetedClassification>(makeTableModel(std::move(table)));
}

std::vector<std::unique_ptr<Constraint>> single(std::unique_ptr<Constraint> constraint) {
    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(std::move(constraint));
    return constraints;
}

Attack makeFixedAttack(std::vector<std::string> outputs,
                       std::vector<std::unique_ptr<Constraint>> constraints = {},
                       AttackConfig config = {}) {
    return Attack(makeGoal(), std::make_unique<FixedTransformation>(std::move(outputs)),
                  giveUpSearch(), std::move(constraints), config);
}

} // namespace

// ─── Construction ──────────────────────────────────────────────

TEST(AttackTest, MissingComponentsAreRejected) {
    auto transformation = [] { return std::make_unique<FixedTransformation>(std::vector<std::string>{}); };
    EXPECT_THROW(Attack(nullptr, transformation(), giveUpSearch()), ConfigurationError);
    EXPECT_THROW(Attack(makeGoal(), nullptr, giveUpSearch()), ConfigurationError);
    EXPECT_THROW(Attack(makeGoal(), transformation(), nullptr), ConfigurationError);

    std::vector<std::unique_ptr<Constraint>> with_null;
    with_null.push_back(nullptr);
    EXPECT_THROW(Attack(makeGoal(), transformation(), giveUpSearch(), std::move(with_null)),
                 ConfigurationError);

    AttackConfig no_cache;
    no_cache.constraint_cache_size = 0;
    EXPECT_THROW(Attack(makeGoal(), transformation(), giveUpSearch(), {}, no_cache),
                 ConfigurationError);
}

TEST(AttackTest, IncompatibleSearchIsRejected) {
    auto picky = std::make_unique<ScriptedSearch>(
        [](const GoalFunctionResult& initial, const SearchCallbacks&) { return initial; },
        /*compatible=*/false);
    try {
        Attack attack(makeGoal(), std::make_unique<WordDeletion>(), std::move(picky));
        FAIL() << "expected CompatibilityError";
    } catch (const CompatibilityError& e) {
        EXPECT_NE(std::string(e.what()).find("WordDeletion"), std::string::npos);
    }
}

TEST(AttackTest, ConstraintsArePartitionedInOrder) {
    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(acceptAll("First"));
    constraints.push_back(std::make_unique<RepeatModification>());
    constraints.push_back(acceptAll("Second"));
    constraints.push_back(std::make_unique<StopwordModification>());
    Attack attack = makeFixedAttack({}, std::move(constraints));

    ASSERT_EQ(attack.preTransformationConstraints().size(), 2);
    EXPECT_EQ(attack.preTransformationConstraints()[0]->name(), "RepeatModification");
    EXPECT_EQ(attack.preTransformationConstraints()[1]->name(), "StopwordModification");
    ASSERT_EQ(attack.constraints().size(), 2);
    EXPECT_EQ(attack.constraints()[0]->name(), "First");
    EXPECT_EQ(attack.constraints()[1]->name(), "Second");
}

TEST(AttackTest, BlackBoxFollowsTransformation) {
    Attack black_box = makeFixedAttack({});
    EXPECT_TRUE(black_box.isBlackBox());

    Attack white_box(makeGoal(), std::make_unique<FixedTransformation>(std::vector<std::string>{}, false),
                     giveUpSearch());
    EXPECT_FALSE(white_box.isBlackBox());
}

TEST(AttackTest, SearchMethodIsBound) {
    Attack attack = makeFixedAttack({});
    EXPECT_TRUE(attack.searchMethod().isBound());
}

// ─── Transformations ───────────────────────────────────────────

TEST(AttackTest, ConstraintFiltersSwaps) {
    auto no_hats = std::make_unique<PredicateConstraint>(
        "NoHats", [](const AttackedText& candidate, const AttackedText&) {
            return candidate.text().find("hats") == std::string::npos;
        });
    Attack attack(makeGoal(),
                  std::make_unique<WordSwapDictionary>(
                      WordSwapDictionary::SynonymMap{{"cats", {"dogs", "hats"}}}),
                  giveUpSearch(), single(std::move(no_hats)));

    auto candidates = attack.getTransformations(AttackedText("I like cats"));
    EXPECT_EQ(textsOf(candidates), std::vector<std::string>{"I like dogs"});
    EXPECT_TRUE(candidates[0].attackAttrs().last_transformation == &attack.transformation());
}

TEST(AttackTest, CurrentTextIsFilteredOut) {
    auto not_current = std::make_unique<PredicateConstraint>(
        "NotCurrent", [](const AttackedText& candidate, const AttackedText& reference) {
            return candidate != reference;
        });
    Attack attack = makeFixedAttack({"I like dogs", "I like hats", "I like cats"},
                                    single(std::move(not_current)));

    AttackedText current("I like cats");
    auto candidates = attack.getTransformations(current);
    EXPECT_EQ(textsOf(candidates), (std::vector<std::string>{"I like dogs", "I like hats"}));

    auto filtered = attack.filterTransformations(
        makeTexts({"I like hats", "I like cats", "I like dogs"}), current);
    EXPECT_EQ(textsOf(filtered), (std::vector<std::string>{"I like dogs", "I like hats"}));
}

TEST(AttackTest, CandidatesAreSortedByText) {
    Attack attack = makeFixedAttack({"c", "a", "b"});
    auto candidates = attack.getTransformations(AttackedText("x"));
    EXPECT_EQ(textsOf(candidates), (std::vector<std::string>{"a", "b", "c"}));
}

// ─── Constraint cache ──────────────────────────────────────────

TEST(AttackTest, RepeatedFilteringUsesCache) {
    auto counted = acceptAll("Counted");
    PredicateConstraint* probe = counted.get();
    Attack attack = makeFixedAttack({}, single(std::move(counted)));

    AttackedText current("x");
    auto candidates = makeTexts({"b", "a", "c"});
    auto first = attack.filterTransformations(candidates, current);
    size_t hits_before = attack.constraintCache().hits();
    auto second = attack.filterTransformations(candidates, current);

    EXPECT_EQ(textsOf(first), textsOf(second));
    EXPECT_EQ(probe->calls(), 1);
    EXPECT_EQ(attack.constraintCache().hits(), hits_before + 3);
}

TEST(AttackTest, CacheIsKeyedByTextContent) {
    auto counted = acceptAll("Counted");
    PredicateConstraint* probe = counted.get();
    Attack attack = makeFixedAttack({}, single(std::move(counted)));

    AttackedText current("x y");
    attack.filterTransformations({AttackedText("z y")}, current);

    // Same rendered texts, different attack attributes.
    AttackedText same_current = AttackedText("w y").replaceWordAtIndex(0, "x");
    AttackedText same_candidate = current.replaceWordAtIndex(0, "z");
    auto again = attack.filterTransformations({same_candidate}, same_current);

    EXPECT_EQ(textsOf(again), std::vector<std::string>{"z y"});
    EXPECT_EQ(probe->calls(), 1);
}

TEST(AttackTest, FirstEmptyStageShortCircuits) {
    auto reject = rejectAll();
    auto after = acceptAll("After");
    PredicateConstraint* probe = after.get();
    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(std::move(reject));
    constraints.push_back(std::move(after));
    Attack attack = makeFixedAttack({}, std::move(constraints));

    auto filtered = attack.filterTransformations(makeTexts({"a", "b"}), AttackedText("x"));
    EXPECT_TRUE(filtered.empty());
    EXPECT_EQ(probe->calls(), 0);
}

TEST(AttackTest, LaterStagesSeeOnlySurvivors) {
    auto no_b = std::make_unique<PredicateConstraint>(
        "NoB", [](const AttackedText& candidate, const AttackedText&) { return candidate.text() != "b"; });
    auto after = acceptAll("After");
    PredicateConstraint* probe = after.get();
    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(std::move(no_b));
    constraints.push_back(std::move(after));
    Attack attack = makeFixedAttack({}, std::move(constraints));

    auto filtered = attack.filterTransformations(makeTexts({"a", "b", "c"}), AttackedText("x"));
    EXPECT_EQ(textsOf(filtered), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(probe->candidatesSeen(), 2);
}

TEST(AttackTest, CacheRecordsPassAndFail) {
    auto no_b = std::make_unique<PredicateConstraint>(
        "NoB", [](const AttackedText& candidate, const AttackedText&) { return candidate.text() != "b"; });
    Attack attack = makeFixedAttack({}, single(std::move(no_b)));

    AttackedText current("x");
    attack.filterTransformations(makeTexts({"a", "b"}), current);
    EXPECT_EQ(attack.constraintCache().peek(current, AttackedText("a")), std::optional<bool>(true));
    EXPECT_EQ(attack.constraintCache().peek(current, AttackedText("b")), std::optional<bool>(false));
    EXPECT_FALSE(attack.constraintCache().peek(current, AttackedText("c")).has_value());
}

TEST(AttackTest, EvictionDuringFilteringKeepsDecisions) {
    AttackConfig config;
    config.constraint_cache_size = 2;
    Attack attack = makeFixedAttack({}, single(acceptAll()), config);

    auto filtered = attack.filterTransformations(makeTexts({"a", "b", "c"}), AttackedText("x"));
    EXPECT_EQ(textsOf(filtered), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(attack.constraintCache().size(), 2);
    EXPECT_GT(attack.constraintCache().evictions(), 0);
}

TEST(AttackTest, CacheHitProtectsEntryFromEviction) {
    AttackConfig config;
    config.constraint_cache_size = 2;
    auto counted = acceptAll("Counted");
    PredicateConstraint* probe = counted.get();
    Attack attack = makeFixedAttack({}, single(std::move(counted)), config);

    AttackedText current("x");
    attack.filterTransformations(makeTexts({"a"}), current);
    attack.filterTransformations(makeTexts({"b"}), current);
    // Hit on "a" makes "b" the least recently used entry.
    attack.filterTransformations(makeTexts({"a"}), current);
    attack.filterTransformations(makeTexts({"c"}), current);

    const auto& cache = attack.constraintCache();
    EXPECT_TRUE(cache.contains(current, AttackedText("a")));
    EXPECT_FALSE(cache.contains(current, AttackedText("b")));
    EXPECT_TRUE(cache.contains(current, AttackedText("c")));
    EXPECT_EQ(probe->calls(), 3);
}

TEST(AttackTest, EmptyConstraintListPassesEverything) {
    Attack attack = makeFixedAttack({"b", "a"});
    auto filtered = attack.filterTransformations(makeTexts({"b", "a"}), AttackedText("x"));
    EXPECT_EQ(textsOf(filtered), (std::vector<std::string>{"a", "b"}));
}

// ─── attackOne ─────────────────────────────────────────────────

TEST(AttackTest, AttackOneRoutesOnSuccess) {
    auto table = std::make_shared<ModelTable>();
    table->rows["flipped"] = {0.2, 0.8};
    auto search = std::make_unique<ScriptedSearch>(
        [](const GoalFunctionResult&, const SearchCallbacks& services) {
            return services.get_goal_results({AttackedText("flipped")}).first.front();
        });
    Attack attack(makeGoal(table), std::make_unique<FixedTransformation>(std::vector<std::string>{}),
                  std::move(search));

    auto initial = attack.goalFunction().getResult(AttackedText("plain"), 0).first;
    auto result = attack.attackOne(initial);
    EXPECT_EQ(result->kind(), AttackResult::Kind::Successful);
    EXPECT_EQ(result->numQueries(), 2);
    EXPECT_EQ(result->originalResult().text.text(), "plain");
    EXPECT_EQ(result->perturbedResult().text.text(), "flipped");
    EXPECT_EQ(result->str(), "[SUCCEEDED] (0) \"plain\" -> (1) \"flipped\" (2 queries)");
}

TEST(AttackTest, AttackOneRoutesOnFailure) {
    Attack attack = makeFixedAttack({});
    auto initial = attack.goalFunction().getResult(AttackedText("plain"), 0).first;
    auto result = attack.attackOne(initial);
    EXPECT_EQ(result->kind(), AttackResult::Kind::Failed);
    EXPECT_EQ(result->numQueries(), 1);
}

// ─── Printing ──────────────────────────────────────────────────

TEST(AttackTest, StrListsComponents) {
    Attack bare = makeFixedAttack({});
    std::string text = bare.str();
    EXPECT_NE(text.find("(search_method): ScriptedSearch"), std::string::npos);
    EXPECT_NE(text.find("(goal_function):  UntargetedClassification"), std::string::npos);
    EXPECT_NE(text.find("(transformation):  FixedTransformation"), std::string::npos);
    EXPECT_NE(text.find("(constraints): None"), std::string::npos);
    EXPECT_NE(text.find("(is_black_box):  True"), std::string::npos);

    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(std::make_unique<RepeatModification>());
    constraints.push_back(acceptAll("Post"));
    Attack with_constraints = makeFixedAttack({}, std::move(constraints));
    text = with_constraints.str();
    EXPECT_NE(text.find("(0): Post"), std::string::npos);
    EXPECT_NE(text.find("(1): RepeatModification"), std::string::npos);
}
