#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "execution/project.hpp"

using namespace std;
using namespace runner;

class ProjectValidationTest : public ::testing::Test {
protected:
    static const set<string> &py() {
        static const set<string> extensions = {".py", ".txt"};
        return extensions;
    }
};

TEST_F(ProjectValidationTest, AcceptsRelativePathsTest) {
    EXPECT_NO_THROW(validate_path("main.py", py()));
    EXPECT_NO_THROW(validate_path("utils/helpers.py", py()));
    EXPECT_NO_THROW(validate_path("data/input.txt", py()));
    EXPECT_NO_THROW(validate_path("pkg/.hidden/a.py", py()));
}

TEST_F(ProjectValidationTest, RejectsUnsafePathsTest) {
    EXPECT_THROW(validate_path("", py()), validation_error);
    EXPECT_THROW(validate_path("/etc/passwd.py", py()), validation_error);
    EXPECT_THROW(validate_path("C:/main.py", py()), validation_error);
    EXPECT_THROW(validate_path("utils\\helpers.py", py()), validation_error);
    EXPECT_THROW(validate_path("../escape.py", py()), validation_error);
    EXPECT_THROW(validate_path("a/../../escape.py", py()), validation_error);
    EXPECT_THROW(validate_path("./main.py", py()), validation_error);
    EXPECT_THROW(validate_path("a//b.py", py()), validation_error);
    EXPECT_THROW(validate_path("dir/", py()), validation_error);
    EXPECT_THROW(validate_path(string("a\0b.py", 6), py()), validation_error);
}

TEST_F(ProjectValidationTest, RejectsExtensionsTest) {
    EXPECT_THROW(validate_path("main.sh", py()), validation_error);
    EXPECT_THROW(validate_path("Makefile", py()), validation_error);
    EXPECT_NO_THROW(validate_path("MAIN.PY", py()));
}

TEST_F(ProjectValidationTest, ResolvesEntryPointTest) {
    vector<project_file> files = {{"src/main.py", "a"}, {"src/util.py", "b"}};
    EXPECT_EQ(resolve_entry_point(files, "src/main.py").content, "a");
    EXPECT_EQ(resolve_entry_point(files, "main.py").content, "a");
    // 后缀匹配必须以完整路径段为单位
    EXPECT_THROW(resolve_entry_point(files, "ain.py"), validation_error);
    EXPECT_THROW(resolve_entry_point(files, "other.py"), validation_error);
    EXPECT_THROW(resolve_entry_point(files, ""), validation_error);
}

TEST_F(ProjectValidationTest, AmbiguousEntryPointTest) {
    vector<project_file> files = {{"a/main.py", ""}, {"b/main.py", ""}};
    EXPECT_THROW(resolve_entry_point(files, "main.py"), validation_error);
    EXPECT_EQ(&resolve_entry_point(files, "b/main.py"), &files[1]);

    // 完全匹配优先于后缀匹配
    files.push_back({"main.py", "root"});
    EXPECT_EQ(resolve_entry_point(files, "main.py").content, "root");
}

TEST_F(ProjectValidationTest, ValidatesProjectTest) {
    EXPECT_NO_THROW(validate_project({{"main.py", "print(1)"}, {"utils/helpers.py", "x = 1"}}, "main.py"));
    EXPECT_THROW(validate_project({}, "main.py"), validation_error);
    EXPECT_THROW(validate_project({{"main.py", ""}, {"main.py", ""}}, "main.py"), validation_error);
    EXPECT_THROW(validate_project({{"main.py", ""}, {"main.py/inner.py", ""}}, "main.py"), validation_error);
    EXPECT_THROW(validate_project({{"main.py", ""}}, "app.py"), validation_error);
    EXPECT_THROW(validate_project({{"main.py", ""}, {"notes.txt", ""}}, "notes.txt"), validation_error);
    EXPECT_THROW(validate_project({{"main.py", "\xff\xfe"}}, "main.py"), validation_error);
}

TEST_F(ProjectValidationTest, ProjectLimitsTest) {
    vector<project_file> files;
    for (size_t i = 0; i <= MAX_PROJECT_FILES; ++i)
        files.push_back({"m" + to_string(i) + ".py", ""});
    EXPECT_THROW(validate_project(files, "m0.py"), validation_error);
    files.pop_back();
    EXPECT_NO_THROW(validate_project(files, "m0.py"));

    EXPECT_THROW(validate_project({{"main.py", string(MAX_FILE_SIZE + 1, 'x')}}, "main.py"), validation_error);
}

TEST_F(ProjectValidationTest, SingleModeRequestTest) {
    execution_request request;
    request.mode = execution_mode::SINGLE;
    request.files = {{"main.py", "print(1)"}};
    EXPECT_NO_THROW(validate_request(request));

    request.files.push_back({"other.py", ""});
    EXPECT_THROW(validate_request(request), validation_error);

    request.mode = execution_mode::PROJECT;
    EXPECT_NO_THROW(validate_request(request));
}
