#include <inspect.hpp>

#include <mediate/types.hpp>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace mediate;
using namespace mediate::tools;

namespace
{

const std::string kPricesManifest = std::string(MEDIATE_EXAMPLES_DIR) + "/manifests/prices.json";

// Writes a manifest to a temporary file, removed on destruction
class TempManifest
{
  public:
    TempManifest(const std::string& name, const std::string& contents)
        : path_(::testing::TempDir() + name)
    {
        std::ofstream file(path_);
        file << contents;
    }

    ~TempManifest()
    {
        std::remove(path_.c_str());
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

struct InspectRun
{
    int code = -1;
    std::string out;
    std::string err;
};

InspectRun inspect(const std::vector<std::string>& args)
{
    std::ostringstream out;
    std::ostringstream err;
    InspectRun run;
    run.code = run_inspect(args, out, err, false);
    run.out = out.str();
    run.err = err.str();
    return run;
}

} // namespace

TEST(InspectTool, ExampleManifestClassifies)
{
    InspectRun run = inspect({kPricesManifest});

    EXPECT_EQ(run.code, InspectOk) << run.err;
    EXPECT_NE(run.out.find("4 mediator(s) classified"), std::string::npos);
    EXPECT_NE(run.out.find("STREAM_TRANSFORMER"), std::string::npos);
    EXPECT_NE(run.out.find("PriceEnricher#enrich"), std::string::npos);
}

TEST(InspectTool, JsonOutput)
{
    InspectRun run = inspect({kPricesManifest, "--json"});
    ASSERT_EQ(run.code, InspectOk) << run.err;

    json configs = json::parse(run.out);
    ASSERT_TRUE(configs.is_array());
    ASSERT_EQ(configs.size(), 4u);
    EXPECT_EQ(configs[0]["method"], "PriceGenerator#generate");
    EXPECT_EQ(configs[0]["outgoing"]["provider"], "in-memory");
    EXPECT_EQ(configs[2]["usesBuilderTypes"], true);
    EXPECT_EQ(configs[3]["consumption"], "MESSAGE");
}

TEST(InspectTool, VerboseLogsEachMediator)
{
    InspectRun run = inspect({"--verbose", kPricesManifest});

    EXPECT_EQ(run.code, InspectOk);
    EXPECT_NE(run.err.find("[mediate] PriceConverter#process: PROCESSOR"), std::string::npos);
}

TEST(InspectTool, ClassificationFailuresExitWithOne)
{
    TempManifest manifest("mediate_inspect_broken.json", R"({"mediators": [
        {"identity": "Source#nothing", "outgoing": "ticks", "returns": "void"},
        {"identity": "Source#fine", "outgoing": "ticks", "returns": "long"},
        {"identity": "Sink#raw", "incoming": "ticks", "returns": {"kind": "subscriber"}}
    ]})");

    InspectRun run = inspect({manifest.path()});

    EXPECT_EQ(run.code, InspectClassificationFailed);
    EXPECT_NE(run.err.find("Source#nothing"), std::string::npos);
    EXPECT_NE(run.err.find("Sink#raw"), std::string::npos);
    EXPECT_NE(run.err.find("2 mediator(s) failed to classify"), std::string::npos);
    EXPECT_TRUE(run.out.empty());
}

TEST(InspectTool, UnboundDeclarationExitsWithOne)
{
    TempManifest manifest("mediate_inspect_unbound.json",
                          R"({"mediators": [{"identity": "Orphan#run", "returns": "int"}]})");

    InspectRun run = inspect({manifest.path()});

    EXPECT_EQ(run.code, InspectClassificationFailed);
    EXPECT_NE(run.err.find("not bound to any channel"), std::string::npos);
}

TEST(InspectTool, ManifestErrorsExitWithTwo)
{
    TempManifest malformed("mediate_inspect_malformed.json", "{\"mediators\": [");
    EXPECT_EQ(inspect({malformed.path()}).code, InspectUsageError);

    TempManifest unknown_kind("mediate_inspect_kind.json", R"({"mediators": [
        {"identity": "A#b", "outgoing": "x", "returns": {"kind": "observable"}}]})");
    InspectRun run = inspect({unknown_kind.path()});
    EXPECT_EQ(run.code, InspectUsageError);
    EXPECT_NE(run.err.find("Unknown type kind: observable"), std::string::npos);

    TempManifest duplicate("mediate_inspect_duplicate.json", R"({"mediators": [
        {"identity": "A#b", "outgoing": "x", "returns": "int"},
        {"identity": "A#b", "outgoing": "y", "returns": "int"}]})");
    EXPECT_EQ(inspect({duplicate.path()}).code, InspectUsageError);

    EXPECT_EQ(inspect({"/nonexistent/mediate/manifest.json"}).code, InspectUsageError);
}

TEST(InspectTool, UsageErrorsExitWithTwo)
{
    EXPECT_EQ(inspect({}).code, InspectUsageError);
    EXPECT_EQ(inspect({"--json"}).code, InspectUsageError);
    EXPECT_EQ(inspect({kPricesManifest, "--colour"}).code, InspectUsageError);
    EXPECT_EQ(inspect({kPricesManifest, "other.json"}).code, InspectUsageError);

    InspectRun run = inspect({});
    EXPECT_NE(run.err.find("Usage: mediate-inspect"), std::string::npos);
}
