#include "translator/StepTranslator.h"
#include "common/TestUtils.h"
#include "engine/DefaultTraversal.h"
#include "engine/DefaultTraversalSource.h"
#include "mocks/MockTraversal.h"
#include "mocks/MockTraversalSource.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace TRV;
using TRV::Test::MockTraversal;
using TRV::Test::MockTraversalSource;
using TRV::Test::StepArgumentsEq;
using TRV::Test::Utils::captureTranslationError;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;

using DefaultStepTranslator = StepTranslator<DefaultTraversalSource, DefaultTraversal>;

class StepTranslatorTest : public ::testing::Test {
protected:
    std::shared_ptr<DefaultTraversalSource> source = DefaultTraversalSource::create();
    DefaultStepTranslator translator{source};

    static Bytecode createMarkoAgeQuery() {
        Bytecode bytecode;
        bytecode.addStep("V")
            .addStep("has", {Values::string("name"), Values::string("marko")})
            .addStep("values", {Values::string("age")});
        return bytecode;
    }

    std::optional<TranslationException> translationError(const Bytecode &bytecode) {
        return captureTranslationError([&] { translator.translate(bytecode); });
    }
};

TEST_F(StepTranslatorTest, BuildsTraversalEquivalentToManualConstruction) {
    auto translated = translator.translate(createMarkoAgeQuery());
    ASSERT_NE(nullptr, translated);

    auto manual = source->V();
    manual->has("name", "marko").values({"age"});

    EXPECT_TRUE(translated->isEquivalentTo(*manual));
    EXPECT_EQ(source, translator.getTraversalSource());
    EXPECT_EQ("gremlin-cpp", translator.getTargetLanguage());
}

TEST_F(StepTranslatorTest, SourceInstructionsConfigureWithoutTouchingOriginalSource) {
    Bytecode bytecode;
    bytecode.addSource("withSack", {Values::integer(1)}).addStep("V").addStep("count");

    auto translated = translator.translate(bytecode);

    ASSERT_EQ(1u, translated->getSourceConfiguration().size());
    EXPECT_EQ("withSack", translated->getSourceConfiguration()[0].name);
    EXPECT_TRUE(source->getConfiguration().empty());

    auto manual = source->with("withSack", {1})->V();
    manual->count();
    EXPECT_TRUE(translated->isEquivalentTo(*manual));
}

TEST_F(StepTranslatorTest, SourceOnlyBytecodeYieldsEmptyConfiguredTraversal) {
    Bytecode bytecode;
    bytecode.addSource("withPath");

    auto translated = translator.translate(bytecode);
    EXPECT_TRUE(translated->getSteps().empty());
    ASSERT_EQ(1u, translated->getSourceConfiguration().size());
    EXPECT_EQ("withPath", translated->getSourceConfiguration()[0].name);
}

TEST_F(StepTranslatorTest, NestedBytecodeBecomesAnonymousTraversal) {
    Bytecode body;
    body.addStep("out", {Values::string("knows")});
    Bytecode bytecode;
    bytecode.addStep("V").addStep("repeat", {Values::bytecode(body)}).addStep("times", {Values::integer(2)});

    auto translated = translator.translate(bytecode);

    auto manualBody = DefaultTraversal::anonymous();
    manualBody->out({"knows"});
    auto manual = source->V();
    manual->repeat(manualBody).times(2);

    EXPECT_TRUE(translated->isEquivalentTo(*manual));
}

TEST_F(StepTranslatorTest, BindingsResolveToTheirValues) {
    Bytecode bytecode;
    bytecode.addStep("V", {Values::binding("person", Values::integer(1))})
        .addStep("has", {Values::string("age"), Values::p("gt", {Values::binding("minAge", Values::integer(30))})});

    auto translated = translator.translate(bytecode);

    auto manual = source->V({1});
    manual->has("age", StepArguments::p("gt", {30}));
    EXPECT_TRUE(translated->isEquivalentTo(*manual));
}

TEST_F(StepTranslatorTest, CollectionsMapsAndOpaqueObjectsAreAdapted) {
    auto point = std::make_shared<TRV::Test::Utils::GeoPoint>(1.0, 2.0);
    Bytecode bytecode;
    bytecode.addStep("inject", {Values::set({Values::string("a")}),
                                Values::map({{Values::enumSymbol("T", "id"), Values::longValue(7)}}),
                                Values::object(point)});

    auto translated = translator.translate(bytecode);

    auto steps = translated->getSteps();
    ASSERT_EQ(1u, steps.size());
    std::vector<StepArgument> expected = {StepArguments::set({std::string("a")}),
                                          StepArguments::map({{StepArguments::enumSymbol("T", "id"), int64_t(7)}}),
                                          std::shared_ptr<const OpaqueObject>(point)};
    EXPECT_THAT(steps[0].arguments, StepArgumentsEq(expected));
}

TEST_F(StepTranslatorTest, EngineErrorsMapToTranslationErrorKinds) {
    Bytecode unknown;
    unknown.addStep("V").addStep("frobnicate");
    auto unknownError = translationError(unknown);
    ASSERT_TRUE(unknownError.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_OPERATION, unknownError->getKind());
    EXPECT_EQ("gremlin-cpp", unknownError->getTargetLanguage());
    EXPECT_EQ(1u, unknownError->getLocation()->instructionIndex);

    Bytecode incompatible;
    incompatible.addStep("V").addStep("times", {Values::string("twice")});
    auto incompatibleError = translationError(incompatible);
    ASSERT_TRUE(incompatibleError.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE, incompatibleError->getKind());

    Bytecode arity;
    arity.addStep("V").addStep("has");
    auto arityError = translationError(arity);
    ASSERT_TRUE(arityError.has_value());
    EXPECT_EQ(TranslationErrorKind::MALFORMED_BYTECODE, arityError->getKind());

    Bytecode unknownSource;
    unknownSource.addSource("withMagic").addStep("V");
    auto sourceError = translationError(unknownSource);
    ASSERT_TRUE(sourceError.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_OPERATION, sourceError->getKind());
    EXPECT_EQ("source", sourceError->getLocation()->phase);
}

TEST_F(StepTranslatorTest, MalformedNestedBytecode) {
    Bytecode nestedWithSource;
    nestedWithSource.addSource("withSack", {Values::integer(1)}).addStep("out");

    Bytecode bytecode;
    bytecode.addStep("V").addStep("where", {Values::bytecode(nestedWithSource)});
    auto error = translationError(bytecode);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(TranslationErrorKind::MALFORMED_BYTECODE, error->getKind());

    Bytecode nullNested;
    nullNested.addStep("V").addStep("where", {Values::bytecode(std::shared_ptr<const Bytecode>())});
    auto nullError = translationError(nullNested);
    ASSERT_TRUE(nullError.has_value());
    EXPECT_EQ(TranslationErrorKind::MALFORMED_BYTECODE, nullError->getKind());
}

TEST_F(StepTranslatorTest, ErrorKindMapping) {
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_OPERATION,
              TraversalBuilder::toTranslationErrorKind(EngineErrorKind::UNKNOWN_OPERATION));
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE,
              TraversalBuilder::toTranslationErrorKind(EngineErrorKind::INCOMPATIBLE_ARGUMENT));
    EXPECT_EQ(TranslationErrorKind::MALFORMED_BYTECODE,
              TraversalBuilder::toTranslationErrorKind(EngineErrorKind::ARITY_MISMATCH));
}

TEST_F(StepTranslatorTest, ConstructorRejectsMisuse) {
    EXPECT_THROW(DefaultStepTranslator(nullptr), std::invalid_argument);
    EXPECT_THROW(DefaultStepTranslator(source, ""), std::invalid_argument);
}

class StepTranslatorEngineTest : public ::testing::Test {
protected:
    using MockStepTranslator = StepTranslator<MockTraversalSource, MockTraversal>;

    using SourceResult = EngineResult<std::shared_ptr<ITraversalSource>>;
    using TraversalResult = EngineResult<std::shared_ptr<ITraversal>>;

    std::shared_ptr<MockTraversalSource> root = std::make_shared<MockTraversalSource>();
    std::shared_ptr<MockTraversalSource> configured = std::make_shared<MockTraversalSource>();
    std::shared_ptr<MockTraversal> traversal = std::make_shared<MockTraversal>();
    std::shared_ptr<MockTraversal> child = std::make_shared<MockTraversal>();

    void TearDown() override {
        // Return() actions holding mocks form shared_ptr cycles through InSequence prerequisites;
        // verify and clear the expectations here so the mocks are released.
        ::testing::Mock::VerifyAndClearExpectations(root.get());
        ::testing::Mock::VerifyAndClearExpectations(configured.get());
        ::testing::Mock::VerifyAndClearExpectations(traversal.get());
        ::testing::Mock::VerifyAndClearExpectations(child.get());
    }
};

TEST_F(StepTranslatorEngineTest, AppliesInstructionsInOrder) {
    Bytecode bytecode;
    bytecode.addSource("withSack", {Values::integer(1)})
        .addStep("V")
        .addStep("out", {Values::string("knows")})
        .addStep("count");

    {
        InSequence sequence;
        EXPECT_CALL(*root, configure("withSack", StepArgumentsEq(std::vector<StepArgument>{1})))
            .WillOnce(Return(SourceResult::createSuccess(configured)));
        EXPECT_CALL(*configured, spawn("V", StepArgumentsEq(std::vector<StepArgument>{})))
            .WillOnce(Return(TraversalResult::createSuccess(traversal)));
        EXPECT_CALL(*traversal, applyStep("out", StepArgumentsEq(std::vector<StepArgument>{std::string("knows")})))
            .WillOnce(Return(EngineResult<void>::createSuccess()));
        EXPECT_CALL(*traversal, applyStep("count", _)).WillOnce(Return(EngineResult<void>::createSuccess()));
    }

    MockStepTranslator translator(root);
    EXPECT_EQ(traversal, translator.translate(bytecode));
}

TEST_F(StepTranslatorEngineTest, SourceOnlyBytecodeStartsFromConfiguredSource) {
    Bytecode bytecode;
    bytecode.addSource("withPath");

    EXPECT_CALL(*root, configure("withPath", _)).WillOnce(Return(SourceResult::createSuccess(configured)));
    EXPECT_CALL(*configured, start()).WillOnce(Return(traversal));
    EXPECT_CALL(*root, start()).Times(0);

    MockStepTranslator translator(root);
    EXPECT_EQ(traversal, translator.translate(bytecode));
}

TEST_F(StepTranslatorEngineTest, NestedBytecodeIsBuiltOnAnonymousTraversal) {
    Bytecode body;
    body.addStep("out", {Values::string("knows")});
    Bytecode bytecode;
    bytecode.addStep("V").addStep("repeat", {Values::bytecode(body)});

    {
        InSequence sequence;
        EXPECT_CALL(*root, spawn("V", _)).WillOnce(Return(TraversalResult::createSuccess(traversal)));
        EXPECT_CALL(*root, createAnonymousTraversal()).WillOnce(Return(child));
        EXPECT_CALL(*child, applyStep("out", _)).WillOnce(Return(EngineResult<void>::createSuccess()));
        EXPECT_CALL(*traversal,
                    applyStep("repeat", StepArgumentsEq(std::vector<StepArgument>{std::shared_ptr<const ITraversal>(child)})))
            .WillOnce(Return(EngineResult<void>::createSuccess()));
    }

    MockStepTranslator translator(root);
    EXPECT_EQ(traversal, translator.translate(bytecode));
}

TEST_F(StepTranslatorEngineTest, MidChainFailureStopsTranslation) {
    Bytecode bytecode;
    bytecode.addStep("V").addStep("out").addStep("count");

    EXPECT_CALL(*root, spawn("V", _)).WillOnce(Return(TraversalResult::createSuccess(traversal)));
    EXPECT_CALL(*traversal, applyStep("out", _))
        .WillOnce(Return(EngineResult<void>::createError(EngineErrorKind::ARITY_MISMATCH, "out needs a label")));
    EXPECT_CALL(*traversal, applyStep("count", _)).Times(0);

    MockStepTranslator translator(root);
    auto error = captureTranslationError([&] { translator.translate(bytecode); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(TranslationErrorKind::MALFORMED_BYTECODE, error->getKind());
    EXPECT_EQ("out needs a label", error->getDetail());
}

TEST_F(StepTranslatorEngineTest, IncompatibleArgumentFromEngine) {
    Bytecode bytecode;
    bytecode.addStep("V", {Values::string("not-an-id")});

    EXPECT_CALL(*root, spawn("V", _))
        .WillOnce(Return(TraversalResult::createError(EngineErrorKind::INCOMPATIBLE_ARGUMENT, "ids must be numbers")));

    MockStepTranslator translator(root);
    auto error = captureTranslationError([&] { translator.translate(bytecode); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE, error->getKind());
}

TEST_F(StepTranslatorEngineTest, UnexpectedTraversalTypeIsUnsupported) {
    Bytecode bytecode;
    bytecode.addStep("V");

    EXPECT_CALL(*root, spawn("V", _))
        .WillOnce(Return(TraversalResult::createSuccess(std::make_shared<DefaultTraversal>())));

    MockStepTranslator translator(root, "mock-engine");
    auto error = captureTranslationError([&] { translator.translate(bytecode); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_OPERATION, error->getKind());
    EXPECT_EQ("mock-engine", error->getTargetLanguage());
}

TEST_F(StepTranslatorEngineTest, SourceOnlyBytecodeWithoutStartedTraversalIsUnsupported) {
    Bytecode bytecode;
    bytecode.addSource("withPath");

    EXPECT_CALL(*root, configure("withPath", _)).WillOnce(Return(SourceResult::createSuccess(configured)));
    EXPECT_CALL(*configured, start()).WillOnce(Return(std::shared_ptr<ITraversal>()));

    MockStepTranslator translator(root);
    auto error = captureTranslationError([&] { translator.translate(bytecode); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(TranslationErrorKind::UNSUPPORTED_OPERATION, error->getKind());
    EXPECT_EQ("engine started no traversal", error->getDetail());
}
