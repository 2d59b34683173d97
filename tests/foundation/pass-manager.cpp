/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <sstream>
#include <stdexcept>
#include <bazinga/foundation/analysis-pass.hpp>
#include <bazinga/foundation/pass-manager.hpp>
#include <bazinga/foundation/pass.hpp>
#include <bazinga/foundation/transform-pass.hpp>
#include <gtest/gtest.h>

class PassManagerFixture : public ::testing::Test
{
protected:
    /* appends "a" to the text */
    class TestPassA final : public bzg::TransformPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "test-pass-a"; }
        [[nodiscard]] std::string_view description() const override { return "Test Pass A"; }

        bool run(bzg::Text& text, bzg::PassContext&) override
        {
            rc++;
            text.set_content(std::string(text.get_content()) + "a");
            return succ;
        }

        void set_success(const bool success) { succ = success; }
        [[nodiscard]] int run_count() const { return rc; }

    private:
        bool succ = true;
        int rc = 0;
    };

    class TestPassB final : public bzg::TransformPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "test-pass-b"; }
        [[nodiscard]] std::string_view description() const override { return "Test Pass B"; }

        [[nodiscard]] std::vector<const std::type_info*> required_passes() const override
        {
            return get_pass_types<TestPassA>();
        }

        bool run(bzg::Text& text, bzg::PassContext&) override
        {
            runc++;
            text.set_content(std::string(text.get_content()) + "b");
            return true;
        }

        [[nodiscard]] int run_count() const { return runc; }

    private:
        int runc = 0;
    };

    class LengthResult final : public bzg::AnalysisResult
    {
    public:
        explicit LengthResult(const std::size_t n) : len(n) {}

        [[nodiscard]] bool invalidated_by(const std::type_info& type) const override
        {
            return type == typeid(TestPassA);
        }

        [[nodiscard]] std::size_t length() const { return len; }

    private:
        std::size_t len;
    };

    class LengthAnalysis final : public bzg::AnalysisPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "length-analysis"; }
        [[nodiscard]] std::string_view description() const override { return "Measures the text"; }

        std::unique_ptr<bzg::AnalysisResult> analyze(bzg::Text& text, bzg::PassContext&) override
        {
            runc++;
            return std::make_unique<LengthResult>(text.size());
        }

        [[nodiscard]] int run_count() const { return runc; }

    private:
        int runc = 0;
    };

    /* has nothing to say about an empty text */
    class NonEmptyAnalysis final : public bzg::AnalysisPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "non-empty-analysis"; }
        [[nodiscard]] std::string_view description() const override { return "Fails on empty text"; }

        std::unique_ptr<bzg::AnalysisResult> analyze(bzg::Text& text, bzg::PassContext&) override
        {
            if (text.empty())
                return nullptr;
            return std::make_unique<LengthResult>(text.size());
        }
    };

    /* consumes the length analysis */
    class LengthUser final : public bzg::TransformPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "length-user"; }
        [[nodiscard]] std::string_view description() const override { return "Reads the length"; }

        [[nodiscard]] std::vector<const std::type_info*> required_passes() const override
        {
            return get_pass_types<LengthAnalysis>();
        }

        bool run(bzg::Text&, bzg::PassContext& ctx) override
        {
            const auto* res = ctx.get_result<LengthAnalysis, LengthResult>();
            if (!res)
                return false;
            ctx.update_stat("length-user.seen", res->length());
            return true;
        }
    };

    /* discards the length analysis explicitly */
    class LengthDropper final : public bzg::TransformPass
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "length-dropper"; }
        [[nodiscard]] std::string_view description() const override { return "Drops the length"; }

        [[nodiscard]] std::vector<const std::type_info*> invalidated_passes() const override
        {
            return get_pass_types<LengthAnalysis>();
        }

        bool run(bzg::Text&, bzg::PassContext&) override
        {
            return true;
        }
    };

    void SetUp() override
    {
        text = std::make_unique<bzg::Text>("test_text", "x");
        manager = std::make_unique<bzg::PassManager>(*text, true, 0);

        pass_a = std::make_unique<TestPassA>();
        pass_b = std::make_unique<TestPassB>();
    }

    void TearDown() override
    {
        manager.reset();
        text.reset();
    }

    std::unique_ptr<bzg::Text> text;
    std::unique_ptr<bzg::PassManager> manager;

    std::unique_ptr<TestPassA> pass_a;
    std::unique_ptr<TestPassB> pass_b;
};

TEST_F(PassManagerFixture, RunSinglePass)
{
    manager->add_pass<TestPassA>();

    const bool result = manager->run_pass<TestPassA>();
    EXPECT_TRUE(result);
    EXPECT_EQ(text->get_content(), "xa");
}

TEST_F(PassManagerFixture, RunAllPassesInInsertionOrder)
{
    manager->add_pass<TestPassA>();
    manager->add_pass<TestPassB>();

    const bool result = manager->run_all();
    EXPECT_TRUE(result);

    /* B requires A, and A is a transform, so it runs again before B */
    EXPECT_EQ(text->get_content(), "xaab");
}

TEST_F(PassManagerFixture, RequiredPassRunsFirst)
{
    TestPassA* raw_a = pass_a.get();
    TestPassB* raw_b = pass_b.get();

    manager->add_pass(std::move(pass_a));
    manager->add_pass(std::move(pass_b));

    EXPECT_TRUE(manager->run_pass<TestPassB>());
    EXPECT_EQ(raw_a->run_count(), 1);
    EXPECT_EQ(raw_b->run_count(), 1);
    EXPECT_EQ(text->get_content(), "xab");
}

TEST_F(PassManagerFixture, DuplicateRegistrationThrows)
{
    manager->add_pass<TestPassA>();
    EXPECT_THROW(manager->add_pass<TestPassA>(), std::runtime_error);
}

TEST_F(PassManagerFixture, UnknownPassThrows)
{
    EXPECT_THROW(manager->run_pass<TestPassA>(), std::runtime_error);
}

TEST_F(PassManagerFixture, MissingRequirementThrows)
{
    manager->add_pass<TestPassB>();
    EXPECT_THROW(manager->run_pass<TestPassB>(), std::runtime_error);
}

TEST_F(PassManagerFixture, FailureHandling)
{
    TestPassA* raw_pass_a = pass_a.get();
    TestPassB* raw_pass_b = pass_b.get();

    raw_pass_a->set_success(false);

    manager->add_pass(std::move(pass_a));
    manager->add_pass(std::move(pass_b));

    const bool result = manager->run_all();
    EXPECT_FALSE(result);
    EXPECT_EQ(raw_pass_a->run_count(), 1);
    EXPECT_EQ(raw_pass_b->run_count(), 0);
}

TEST_F(PassManagerFixture, CachedAnalysisIsReused)
{
    auto analysis = std::make_unique<LengthAnalysis>();
    const LengthAnalysis* raw = analysis.get();

    manager->add_pass(std::move(analysis));
    manager->add_pass<LengthUser>();

    EXPECT_TRUE(manager->run_all());
    EXPECT_EQ(raw->run_count(), 1);
    EXPECT_EQ(manager->get_context().get_stat("length-user.seen"), 1);
}

TEST_F(PassManagerFixture, TransformInvalidatesAnalysis)
{
    auto analysis = std::make_unique<LengthAnalysis>();
    const LengthAnalysis* raw = analysis.get();

    manager->add_pass(std::move(analysis));
    manager->add_pass<TestPassA>();
    manager->add_pass<LengthUser>();

    EXPECT_TRUE(manager->run_all());

    /* TestPassA dropped the cached length, so LengthUser recomputed it */
    EXPECT_EQ(raw->run_count(), 2);
    EXPECT_EQ(manager->get_context().get_stat("length-user.seen"), 2);
}

TEST_F(PassManagerFixture, NullAnalysisResultIsFailure)
{
    text->set_content("");
    manager->add_pass<NonEmptyAnalysis>();

    EXPECT_FALSE(manager->run_pass<NonEmptyAnalysis>());
    EXPECT_FALSE(manager->get_context().has_result(typeid(NonEmptyAnalysis)));

    text->set_content("abc");
    EXPECT_TRUE(manager->run_pass<NonEmptyAnalysis>());

    const auto* res = manager->get_context().get_result<NonEmptyAnalysis, LengthResult>();
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(res->length(), 3);
}

TEST_F(PassManagerFixture, DirectRewriteForcesRequiredAnalysisToRerun)
{
    auto analysis = std::make_unique<LengthAnalysis>();
    const LengthAnalysis* raw = analysis.get();

    manager->add_pass(std::move(analysis));
    manager->add_pass<LengthUser>();

    EXPECT_TRUE(manager->run_pass<LengthAnalysis>());
    text->set_content("xyz");
    EXPECT_TRUE(manager->run_pass<LengthUser>());

    EXPECT_EQ(raw->run_count(), 2);
    EXPECT_EQ(manager->get_context().get_stat("length-user.seen"), 3);
}

TEST_F(PassManagerFixture, DeclaredInvalidationDropsResult)
{
    manager->add_pass<LengthAnalysis>();
    manager->add_pass<LengthDropper>();

    EXPECT_TRUE(manager->run_pass<LengthAnalysis>());
    EXPECT_TRUE(manager->get_context().has_result(typeid(LengthAnalysis)));

    EXPECT_TRUE(manager->run_pass<LengthDropper>());
    EXPECT_FALSE(manager->get_context().has_result(typeid(LengthAnalysis)));
}

TEST_F(PassManagerFixture, StatisticsPrinting)
{
    std::stringstream empty;
    manager->print_statistics(empty);
    EXPECT_EQ(empty.str(), "no passes have run on 'test_text'\n");

    manager->add_pass<TestPassA>();
    manager->add_pass<TestPassB>();

    manager->run_all();

    std::stringstream output;
    manager->print_statistics(output);

    const std::string stats = output.str();

    /* A ran on its own and again as B's requirement */
    EXPECT_EQ(stats.rfind("'test_text': 3 pass runs in ", 0), 0);

    const auto a = stats.find("test-pass-a");
    const auto b = stats.find("test-pass-b");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    EXPECT_LT(a, b);
    EXPECT_NE(stats.find("2x", a), std::string::npos);
}

TEST_F(PassManagerFixture, StatisticsSkipPassesThatNeverRan)
{
    manager->add_pass<TestPassA>();
    manager->add_pass<LengthAnalysis>();
    manager->run_pass<LengthAnalysis>();

    std::stringstream output;
    manager->print_statistics(output);

    const std::string stats = output.str();
    EXPECT_NE(stats.find("length-analysis"), std::string::npos);
    EXPECT_EQ(stats.find("test-pass-a"), std::string::npos);
}

TEST_F(PassManagerFixture, VerboseProgressGoesToStdout)
{
    manager->set_verbosity(1);
    manager->add_pass<TestPassA>();

    testing::internal::CaptureStdout();
    manager->run_all();
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("pass test-pass-a completed in"), std::string::npos);
    EXPECT_NE(out.find("(success)"), std::string::npos);
}
