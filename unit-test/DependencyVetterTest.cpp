#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "verify/dependency_vetter.hpp"

using namespace std;
using namespace verifier;

static dependency_policy sample_policy() {
    dependency_policy policy;
    policy.banned = {"pickle5", "left-pad"};
    advisory adv;
    adv.name = "requests";
    adv.below_version = "2.31.0";
    adv.cve = "CVE-2023-32681";
    adv.severity = severity::MEDIUM;
    adv.description = "Proxy-Authorization header leak";
    adv.fixed_version = "2.31.0";
    policy.advisories.push_back(adv);
    return policy;
}

TEST(DependencyVetterTest, RequirementsTest) {
    manifest_dependency_vetter vetter(sample_policy());
    vector<code_artifact> artifacts = {
        {"requirements.txt",
         "# runtime\n"
         "requests==2.28.0\n"
         "Flask==3.0.0  # web\n"
         "numpy>=1.26\n"
         "pyyaml\n"
         "Pickle_5==0.0.11\n"
         "-r requirements-dev.txt\n"
         "uvicorn[standard]==0.30.1 ; python_version >= '3.8'\n",
         artifact_type::REQUIREMENTS}};
    auto vets = vetter.vet(artifacts, {});
    ASSERT_EQ(vets.size(), 6u);

    EXPECT_EQ(vets[0].name, "requests");
    EXPECT_EQ(vets[0].version, "2.28.0");
    EXPECT_EQ(vets[0].status, dependency_status::OUTDATED);
    ASSERT_TRUE(vets[0].vulnerability.has_value());
    EXPECT_EQ(vets[0].vulnerability->cve, "CVE-2023-32681");
    EXPECT_EQ(vets[0].reason, "Affected by CVE-2023-32681, upgrade to 2.31.0");

    EXPECT_EQ(vets[1].name, "Flask");
    EXPECT_EQ(vets[1].version, "3.0.0");
    EXPECT_EQ(vets[1].status, dependency_status::APPROVED);
    EXPECT_EQ(vets[1].source, "requirements.txt");

    EXPECT_EQ(vets[2].status, dependency_status::UNPINNED);
    EXPECT_EQ(vets[2].version, ">=1.26");
    EXPECT_EQ(vets[3].status, dependency_status::UNPINNED);
    EXPECT_EQ(vets[3].reason, "No version specified");

    EXPECT_EQ(vets[4].status, dependency_status::BANNED);
    EXPECT_EQ(vets[5].name, "uvicorn");
    EXPECT_EQ(vets[5].status, dependency_status::APPROVED);
}

TEST(DependencyVetterTest, FixedVersionIsNotAffectedTest) {
    manifest_dependency_vetter vetter(sample_policy());
    vector<code_artifact> artifacts = {{"requirements.txt", "requests==2.31.0\n", artifact_type::REQUIREMENTS}};
    auto vets = vetter.vet(artifacts, {});
    ASSERT_EQ(vets.size(), 1u);
    EXPECT_EQ(vets[0].status, dependency_status::APPROVED);
    EXPECT_FALSE(vets[0].vulnerability.has_value());
}

TEST(DependencyVetterTest, AllowedListTest) {
    manifest_dependency_vetter vetter;
    security_constraints constraints;
    constraints.allowed_dependencies = {"requests", "flask"};
    vector<code_artifact> artifacts = {
        {"requirements.txt", "requests==2.31.0\nFLASK==3.0.0\nhttpx==0.27.0\n", artifact_type::REQUIREMENTS}};
    auto vets = vetter.vet(artifacts, constraints);
    ASSERT_EQ(vets.size(), 3u);
    EXPECT_EQ(vets[0].status, dependency_status::APPROVED);
    EXPECT_EQ(vets[1].status, dependency_status::APPROVED);
    EXPECT_EQ(vets[2].status, dependency_status::BANNED);
    EXPECT_EQ(vets[2].reason, "Dependency is not in the task's allowed dependency list");
}

TEST(DependencyVetterTest, PackageJsonTest) {
    manifest_dependency_vetter vetter(sample_policy());
    vector<code_artifact> artifacts = {
        {"web/package.json", R"({
  "name": "web",
  "dependencies": {"express": "4.19.2", "lodash": "^4.17.21", "left-pad": "1.3.0"},
  "devDependencies": {"jest": "v29.7.0", "eslint": "latest"}
})",
         artifact_type::CONFIG}};
    auto vets = vetter.vet(artifacts, {});
    ASSERT_EQ(vets.size(), 5u);

    map<string, dependency_vet> by_name;
    for (auto &vet : vets) by_name[vet.name] = vet;
    EXPECT_EQ(by_name["express"].status, dependency_status::APPROVED);
    EXPECT_EQ(by_name["lodash"].status, dependency_status::UNPINNED);
    EXPECT_EQ(by_name["left-pad"].status, dependency_status::BANNED);
    EXPECT_EQ(by_name["jest"].status, dependency_status::APPROVED);
    EXPECT_EQ(by_name["jest"].version, "29.7.0");
    EXPECT_EQ(by_name["eslint"].status, dependency_status::UNPINNED);
    EXPECT_EQ(by_name["express"].source, "web/package.json");
}

TEST(DependencyVetterTest, SourceFilesAreIgnoredTest) {
    manifest_dependency_vetter vetter;
    vector<code_artifact> artifacts = {{"app/main.py", "import requests\n", artifact_type::SOURCE}};
    EXPECT_TRUE(vetter.vet(artifacts, {}).empty());
}

TEST(DependencyVetterTest, MalformedPackageJsonTest) {
    manifest_dependency_vetter vetter;
    EXPECT_THROW(vetter.vet({{"package.json", "{\"dependencies\": ", artifact_type::CONFIG}}, {}), sandbox_error);
    EXPECT_THROW(vetter.vet({{"package.json", "[1, 2]", artifact_type::CONFIG}}, {}), sandbox_error);
}

TEST(DependencyVetterTest, CompareVersionsTest) {
    EXPECT_EQ(compare_versions("1.2.3", "1.2.3"), 0);
    EXPECT_EQ(compare_versions("1.2", "1.2.0"), 0);
    EXPECT_LT(compare_versions("1.2.3", "1.10.0"), 0);
    EXPECT_GT(compare_versions("2.0.0", "1.99.99"), 0);
    EXPECT_LT(compare_versions("==2.28.0", "2.31.0"), 0);
    EXPECT_EQ(compare_versions("4.17.21-beta", "4.17.21"), 0);
}
