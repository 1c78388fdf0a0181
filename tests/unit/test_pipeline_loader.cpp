/**
 * @file test_pipeline_loader.cpp
 * @brief Unit tests for TOML pipeline loading and --param parsing.
 */

#include "workload/pipeline_loader.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace dagbuild;

TEST(PipelineLoaderTest, ParsesTasksInOrder) {
    auto result = PipelineLoader::parse(R"(
        name = "etl"

        [params]
        force = true
        limit = 10
        ratio = 0.5
        env = "prod"

        [[task]]
        name = "extract"
        command = "echo extract"

        [[task]]
        name = "transform"
        command = "echo transform"
        status = "skipped"

        [[task]]
        name = "load"
        command = "echo load"
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& pipeline = *result;
    EXPECT_EQ(pipeline.dag.name(), "etl");
    EXPECT_EQ(pipeline.dag.task_names(),
              (std::vector<TaskId>{"extract", "transform", "load"}));

    auto* transform = pipeline.dag.find("transform");
    ASSERT_NE(transform, nullptr);
    EXPECT_EQ(transform->exec_status(), TaskStatus::Skipped);
    EXPECT_EQ(transform->source_kind(), SourceKind::ExternalCommand);
    EXPECT_EQ(pipeline.dag.find("load")->exec_status(), TaskStatus::Waiting);

    ASSERT_EQ(pipeline.params.size(), 4u);
    EXPECT_EQ(std::get<bool>(pipeline.params.at("force")), true);
    EXPECT_EQ(std::get<int64_t>(pipeline.params.at("limit")), 10);
    EXPECT_DOUBLE_EQ(std::get<double>(pipeline.params.at("ratio")), 0.5);
    EXPECT_EQ(std::get<std::string>(pipeline.params.at("env")), "prod");
}

TEST(PipelineLoaderTest, NoTasksIsValid) {
    auto result = PipelineLoader::parse(R"(name = "empty")");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->dag.empty());
    EXPECT_TRUE(result->params.empty());
}

TEST(PipelineLoaderTest, MissingNameRejected) {
    auto result = PipelineLoader::parse(R"(
        [[task]]
        name = "a"
        command = "true"
    )");
    EXPECT_FALSE(result.has_value());
}

TEST(PipelineLoaderTest, MissingCommandRejected) {
    auto result = PipelineLoader::parse(R"(
        name = "p"
        [[task]]
        name = "a"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("command"), std::string::npos);
}

TEST(PipelineLoaderTest, DuplicateTaskRejected) {
    auto result = PipelineLoader::parse(R"(
        name = "p"
        [[task]]
        name = "a"
        command = "true"
        [[task]]
        name = "a"
        command = "false"
    )");
    EXPECT_FALSE(result.has_value());
}

TEST(PipelineLoaderTest, InvalidStatusRejected) {
    auto result = PipelineLoader::parse(R"(
        name = "p"
        [[task]]
        name = "a"
        command = "true"
        status = "executed"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("executed"), std::string::npos);
}

TEST(PipelineLoaderTest, MalformedToml) {
    auto result = PipelineLoader::parse("name = ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message.rfind("TOML parse error", 0), 0u);
}

TEST(PipelineLoaderTest, LoadFile) {
    const auto dir = dagbuild::test::scratch_dir("dagbuild_pipeline");
    std::filesystem::create_directories(dir);
    const auto path = dir / "pipeline.toml";
    {
        std::ofstream ofs(path);
        ofs << "name = \"from_file\"\n[[task]]\nname = \"t\"\ncommand = \"true\"\n";
    }

    auto result = PipelineLoader::load_file(path);
    std::filesystem::remove_all(dir);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->dag.name(), "from_file");
    EXPECT_EQ(result->dag.size(), 1u);
}

TEST(PipelineLoaderTest, LoadMissingFile) {
    EXPECT_FALSE(PipelineLoader::load_file("/nonexistent/pipeline.toml").has_value());
}

// ─── Entry status / param parsing ────────────

TEST(EntryStatusTest, Parse) {
    EXPECT_EQ(*parse_entry_status("waiting"), TaskStatus::Waiting);
    EXPECT_EQ(*parse_entry_status("skipped"), TaskStatus::Skipped);
    EXPECT_EQ(*parse_entry_status("aborted"), TaskStatus::Aborted);
    EXPECT_FALSE(parse_entry_status("errored").has_value());
}

TEST(ParamAssignmentTest, TypedValues) {
    auto b = parse_param_assignment("force=true");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->first, "force");
    EXPECT_EQ(std::get<bool>(b->second), true);

    auto i = parse_param_assignment("n=-42");
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(std::get<int64_t>(i->second), -42);

    auto d = parse_param_assignment("ratio=1.25");
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(d->second), 1.25);

    auto s = parse_param_assignment("env=prod=eu");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->first, "env");
    EXPECT_EQ(std::get<std::string>(s->second), "prod=eu");
}

TEST(ParamAssignmentTest, EmptyValueIsString) {
    auto r = parse_param_assignment("tag=");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<std::string>(r->second), "");
}

TEST(ParamAssignmentTest, Malformed) {
    EXPECT_FALSE(parse_param_assignment("novalue").has_value());
    EXPECT_FALSE(parse_param_assignment("=x").has_value());
}
