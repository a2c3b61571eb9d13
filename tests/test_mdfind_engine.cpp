//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_mdfind_engine.cpp
// Purpose: GoogleTests for the mdfind/mdls engine against a scripted process runner
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <memory>
#include <system_error>
#include "mdagent/search/MdfindSearchEngine.h"

using namespace mdagent::search;

namespace {

// Answers mdfind with a fixed output and mdls from a per-path table
class ScriptedRunner : public IProcessRunner {
public:
    ProcessOutput mdfind;
    std::map<std::string, std::string> mdls;
    std::vector<std::vector<std::string>> calls;
    bool throwOnRun{false};

    ProcessOutput Run(const std::vector<std::string>& argv) override {
        calls.push_back(argv);
        if (throwOnRun) throw std::system_error(ENOENT, std::generic_category(), "execvp");
        if (argv.front() == "mdfind") return mdfind;
        auto it = mdls.find(argv.back());
        if (it == mdls.end()) {
            return ProcessOutput{1, "", argv.back() + ": could not find " + argv.back() + ".\n"};
        }
        return ProcessOutput{0, it->second, ""};
    }

    size_t mdlsCalls() const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [](const std::vector<std::string>& c) { return c.front() == "mdls"; }));
    }
};

std::string mdlsRecord(const std::string& size, const std::string& modified) {
    return "kMDItemContentModificationDate = " + modified + "\n"
           "kMDItemContentType             = \"public.plain-text\"\n"
           "kMDItemFSCreationDate          = (null)\n"
           "kMDItemFSSize                  = " + size + "\n"
           "kMDItemKind                    = \"Plain Text\"\n";
}

std::shared_ptr<ScriptedRunner> threeFiles() {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->mdfind = ProcessOutput{0, std::string("/d/b.txt\0/d/c.txt\0/d/a.txt\0", 27), ""};
    runner->mdls["/d/a.txt"] = mdlsRecord("300", "2024-01-02 03:04:05 +0000");
    runner->mdls["/d/b.txt"] = mdlsRecord("100", "2024-01-03 03:04:05 +0000");
    runner->mdls["/d/c.txt"] = mdlsRecord("200", "2024-01-01 03:04:05 +0000");
    return runner;
}

std::vector<std::string> paths(const std::vector<SearchResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) out.push_back(r.path);
    return out;
}

} // namespace

TEST(MdlsParsing, RecordFields) {
    MdlsRecord rec = ParseMdlsOutput(mdlsRecord("1536", "2024-01-02 03:04:05 +0000"));
    EXPECT_EQ(rec["kMDItemKind"], "Plain Text");
    EXPECT_EQ(rec["kMDItemFSSize"], "1536");
    EXPECT_EQ(rec.count("kMDItemFSCreationDate"), 0u);
}

TEST(MdlsParsing, Dates) {
    auto utc = ParseMdlsDate("2024-01-02 03:04:05 +0000");
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*utc), 1704164645);

    auto east = ParseMdlsDate("2024-01-02 05:04:05 +0200");
    ASSERT_TRUE(east.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*east), 1704164645);

    EXPECT_FALSE(ParseMdlsDate("yesterday").has_value());
}

TEST(MdfindEngine, ArgvCarriesScopesAndQuery) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "kMDItemFSName == \"*.txt\"cd";
    req.scopes = {"/d", "/e"};
    (void)engine.Execute(req);
    ASSERT_FALSE(runner->calls.empty());
    EXPECT_EQ(runner->calls.front(),
              (std::vector<std::string>{"mdfind", "-0", "-onlyin", "/d", "-onlyin", "/e", req.query}));
}

TEST(MdfindEngine, UnsortedKeepsIndexOrderAndTruncatesFirst) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "q";
    req.limit = 2;
    auto results = engine.Execute(req);
    EXPECT_EQ(paths(results), (std::vector<std::string>{"/d/b.txt", "/d/c.txt"}));
    EXPECT_EQ(runner->mdlsCalls(), 2u);
    ASSERT_TRUE(results[0].size.has_value());
    EXPECT_EQ(*results[0].size, 100);
    EXPECT_EQ(results[0].kind, std::optional<std::string>("Plain Text"));
    EXPECT_FALSE(results[0].created.has_value());
}

TEST(MdfindEngine, SortByNameUsesBasename) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "q";
    req.sortBy = "kMDItemFSName";
    req.descending = false;
    EXPECT_EQ(paths(engine.Execute(req)), (std::vector<std::string>{"/d/a.txt", "/d/b.txt", "/d/c.txt"}));
}

TEST(MdfindEngine, SortBySizeIsNumeric) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "q";
    req.sortBy = "kMDItemFSSize";
    req.descending = true;
    req.limit = 2;
    EXPECT_EQ(paths(engine.Execute(req)), (std::vector<std::string>{"/d/a.txt", "/d/c.txt"}));
    EXPECT_EQ(runner->mdlsCalls(), 3u);
}

TEST(MdfindEngine, SortByDateAscending) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "q";
    req.sortBy = "kMDItemContentModificationDate";
    req.descending = false;
    EXPECT_EQ(paths(engine.Execute(req)), (std::vector<std::string>{"/d/c.txt", "/d/a.txt", "/d/b.txt"}));
}

TEST(MdfindEngine, VanishedFileKeepsPathOnly) {
    auto runner = threeFiles();
    runner->mdls.erase("/d/c.txt");
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "q";
    auto results = engine.Execute(req);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[1].path, "/d/c.txt");
    EXPECT_FALSE(results[1].size.has_value());
}

TEST(MdfindEngine, QueryFailureRaisesSearchError) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->mdfind = ProcessOutput{0, "", "Failed to create query for 'kMDItem =='.\n"};
    MdfindSearchEngine engine(runner);
    SearchRequest req;
    req.query = "kMDItem ==";
    EXPECT_THROW((void)engine.Execute(req), SearchError);

    runner->mdfind = ProcessOutput{2, "", ""};
    EXPECT_THROW((void)engine.Count("q", {}), SearchError);
}

TEST(MdfindEngine, SpawnFailureRaisesSearchError) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->throwOnRun = true;
    MdfindSearchEngine engine(runner);
    EXPECT_THROW((void)engine.Metadata("/x"), SearchError);
}

TEST(MdfindEngine, CountParsesInteger) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->mdfind = ProcessOutput{0, "17\n", ""};
    MdfindSearchEngine engine(runner, MdfindConfig{"mdfind", "mdls"});
    EXPECT_EQ(engine.Count("q", {"/d"}), 17);
    EXPECT_EQ(runner->calls.front(), (std::vector<std::string>{"mdfind", "-count", "-onlyin", "/d", "q"}));

    runner->mdfind = ProcessOutput{0, "many\n", ""};
    EXPECT_THROW((void)engine.Count("q", {}), SearchError);
}

TEST(MdfindEngine, MetadataDumpAndMissingPath) {
    auto runner = threeFiles();
    MdfindSearchEngine engine(runner);
    const std::string dump = engine.Metadata("/d/a.txt");
    EXPECT_EQ(dump.back(), '"');
    EXPECT_NE(dump.find("kMDItemKind"), std::string::npos);
    EXPECT_EQ(runner->calls.back(), (std::vector<std::string>{"mdls", "/d/a.txt"}));

    try {
        (void)engine.Metadata("/nowhere");
        FAIL() << "expected SearchError";
    } catch (const SearchError& e) {
        EXPECT_NE(std::string(e.what()).find("could not find"), std::string::npos);
    }
}
