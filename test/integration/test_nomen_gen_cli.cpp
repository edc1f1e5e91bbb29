#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

class NomenGenCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "nomen_gen_cli_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    // Runs nomen_gen with stdout and stderr captured; returns the raw std::system status.
    int run(const std::string& args) {
        std::string cmd = std::string("\"") + NOMEN_GEN_PATH + "\" " + args + " > " +
                          (temp_dir / "stdout.txt").string() + " 2> " +
                          (temp_dir / "stderr.txt").string();
        return std::system(cmd.c_str());
    }

    std::string read_file(const std::string& filename) {
        std::ifstream in(temp_dir / filename);
        if (!in) {
            return "";
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string out() { return read_file("stdout.txt"); }
    std::string err() { return read_file("stderr.txt"); }

    fs::path temp_dir;
};

TEST_F(NomenGenCliTest, ProjectIdiomaticMembers) {
    ASSERT_EQ(run("project -s idiomatic -r member \"Hello world\" HTTPProxy NOT_AVAILABLE"), 0);
    EXPECT_EQ(out(), "helloWorld\nhttpProxy\nnotAvailable\n");
}

TEST_F(NomenGenCliTest, ProjectDefaultsToDefensive) {
    ASSERT_EQ(run("project \"Hello world\" \"order#123\""), 0);
    EXPECT_EQ(out(), "Hello_space_world\norder_num_123\n");
}

TEST_F(NomenGenCliTest, ProjectWithOverride) {
    ASSERT_EQ(run("project -s idiomatic --override \"order#123=OrderNumber\" \"order#123\""), 0);
    EXPECT_EQ(out(), "OrderNumber\n");
}

TEST_F(NomenGenCliTest, ProjectJson) {
    ASSERT_EQ(run("project -s idiomatic --json \"version 2.0\""), 0);
    EXPECT_EQ(out(), "[{\"raw\":\"version 2.0\",\"identifier\":\"Version2_0\"}]\n");
}

TEST_F(NomenGenCliTest, ContentType) {
    ASSERT_EQ(run("content-type -s idiomatic application/json-seq text/event-stream"), 0);
    EXPECT_EQ(out(), "applicationJsonSeq\ntextEventStream\n");
}

TEST_F(NomenGenCliTest, ServerJson) {
    ASSERT_EQ(run("server -s idiomatic -u \"https://{environment}.example.com\" "
                  "--var \"environment=prod=prod|staging|dev\" --json"),
              0);
    auto json = out();
    EXPECT_NE(json.find("\"namespace\":\"Server1\""), std::string::npos);
    EXPECT_NE(json.find("{\"name\":\"Prod\",\"rawValue\":\"prod\"}"), std::string::npos);
    EXPECT_NE(json.find("\"default\":\"Environment::Prod\""), std::string::npos);
    EXPECT_NE(json.find("\"legacyAccessor\":{\"name\":\"server1\",\"deprecated\":true"),
              std::string::npos);
    EXPECT_NE(json.find("\"default\":\"\\\"prod\\\"\""), std::string::npos);
    EXPECT_TRUE(err().empty());
}

TEST_F(NomenGenCliTest, ServerCollisionWarning) {
    ASSERT_EQ(run("server -s idiomatic -u \"https://{flavor}.example.com\" "
                  "--var \"flavor=baz=foo-bar|foo_bar|baz\""),
              0);
    EXPECT_NE(err().find("[servers] warning: Server1: variable 'flavor'"), std::string::npos);
    EXPECT_NE(out().find("enum class Flavor { FooBar = \"foo-bar\", Baz = \"baz\" };"),
              std::string::npos);
}

TEST_F(NomenGenCliTest, ServerCollisionFailPolicy) {
    EXPECT_NE(run("server -s idiomatic --collisions fail -u \"https://{flavor}.example.com\" "
                  "--var \"flavor=baz=foo-bar|foo_bar|baz\""),
              0);
    EXPECT_NE(err().find("[servers] error: Server1"), std::string::npos);
}

TEST_F(NomenGenCliTest, ServerParallel) {
    ASSERT_EQ(run("server --parallel -u \"https://a.example.com\" -u \"https://{v}.example.com\" "
                  "--var v=x"),
              0);
    auto text = out();
    auto first = text.find("namespace Server1");
    auto second = text.find("namespace Server2");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(text.find("std::string url(std::string v = \"x\");"), std::string::npos);
}

TEST_F(NomenGenCliTest, ServerAccessAndFileComments) {
    ASSERT_EQ(run("server -a public --file-comment \"clang-format off\" "
                  "-u \"https://{region}.example.com\" --var \"region=eu=eu|us\""),
              0);
    auto text = out();
    EXPECT_EQ(text.rfind("// clang-format off\n", 0), 0u);
    EXPECT_EQ(text.find("visibility"), std::string::npos);

    ASSERT_EQ(run("server -u \"https://{region}.example.com\" --var \"region=eu=eu|us\""), 0);
    EXPECT_NE(out().find("[[gnu::visibility(\"hidden\")]] std::string url("), std::string::npos);
}

TEST_F(NomenGenCliTest, ServerCollidingDefaultKeepsWireValue) {
    ASSERT_EQ(run("server -s idiomatic -u \"https://{flavor}.example.com\" "
                  "--var \"flavor=foo_bar=foo-bar|foo_bar|baz\""),
              0);
    EXPECT_NE(out().find("enum class Flavor { FooBar = \"foo_bar\", Baz = \"baz\" };"),
              std::string::npos);
    EXPECT_NE(err().find("'foo-bar' was omitted"), std::string::npos);
}

TEST_F(NomenGenCliTest, ExamplesExitZero) {
    EXPECT_EQ(run("examples"), 0);
    EXPECT_NE(out().find("nomen_gen examples:"), std::string::npos);
}

TEST_F(NomenGenCliTest, InvalidInputFails) {
    EXPECT_NE(run("project -s fancy name"), 0);
    EXPECT_NE(err().find("unknown naming strategy"), std::string::npos);

    EXPECT_NE(run("project -r field name"), 0);
    EXPECT_NE(run("server -m library -u \"https://a.example.com\""), 0);
    EXPECT_NE(err().find("unknown generator mode"), std::string::npos);
    EXPECT_NE(run("server -a package -u \"https://a.example.com\""), 0);
    EXPECT_NE(err().find("unknown access modifier"), std::string::npos);
    EXPECT_NE(run("project --override nope name"), 0);
    EXPECT_NE(run("server -u \"https://{v}\" --var \"=x\""), 0);
    EXPECT_NE(run("frobnicate"), 0);
    EXPECT_NE(run("project"), 0);
}
