#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "export/CsvSerializer.hpp"

#include <csignal>
#include <sys/resource.h>

using namespace dsearch;
using namespace dsearch::test;

namespace {

void load_sites(FeatureStore& store) {
    make_layer(store, "mem:data/Sites", wkbPoint, {
        FieldInfo("Name", FieldType::STRING, 40),
        FieldInfo("Type", FieldType::STRING, 20),
        FieldInfo("Distance", FieldType::DOUBLE),
        FieldInfo("Area", FieldType::DOUBLE),
    }, {
        {"POINT (1 2)", {std::string("Oak Wood"), std::string("Wood"), 12.7, 1.25}},
        {"POINT (3 4)", {std::string("Heath, North"), std::string("Heath"), -0.4, FieldValue{}}},
        {"POINT (5 6)", {std::string("Ash Copse"), std::string("Wood"), 300.0, 0.5}},
    }, "Sites");
}

/** Values split on commas outside double quotes, quotes removed */
std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> values(1);
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            values.emplace_back();
        } else {
            values.back() += c;
        }
    }
    return values;
}

/** Caps the size of files this process may write, as a full disk would */
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        getrlimit(RLIMIT_FSIZE, &previous_);
        rlimit limited = previous_;
        limited.rlim_cur = bytes;
        setrlimit(RLIMIT_FSIZE, &limited);
    }

    ~FileSizeLimit() {
        setrlimit(RLIMIT_FSIZE, &previous_);
        std::signal(SIGXFSZ, previous_handler_);
    }

private:
    rlimit previous_;
    void (*previous_handler_)(int);
};

} // anonymous namespace

TEST_CASE("value formatting") {
    REQUIRE(CsvSerializer::format_value(FieldValue{}, false).empty());
    REQUIRE(CsvSerializer::format_value(FieldValue{}, true).empty());
    REQUIRE(CsvSerializer::format_value(FieldValue{12.7}, true) == "12");
    REQUIRE(CsvSerializer::format_value(FieldValue{-0.4}, true) == "0");
    REQUIRE(CsvSerializer::format_value(FieldValue{-3.9}, true) == "-3");
    REQUIRE(CsvSerializer::format_value(FieldValue{12.7}, false) == "12.7");
    REQUIRE(CsvSerializer::format_value(FieldValue{std::string("a,b")}, false) == "\"a,b\"");
    REQUIRE(CsvSerializer::format_value(FieldValue{std::string("say \"hi\"")}, false) == "say \"hi\"");
    REQUIRE(CsvSerializer::format_value(FieldValue{std::string("n/a")}, true) == "n/a");
}

TEST_CASE("rows are written with a header") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_header") / "sites.csv";

    SECTION("store order") {
        REQUIRE(serializer.write_csv("Sites", path.string(), "Name,Distance,Area") == 3);
        REQUIRE(read_lines(path) == std::vector<std::string>{
            "Name,Distance,Area",
            "Oak Wood,12,1.25",
            "\"Heath, North\",0,",
            "Ash Copse,300,0.5",
        });
    }

    SECTION("literals, unknown columns and ordering") {
        CsvSerializer::Options options;
        options.order_columns = "Type,Name";
        REQUIRE(serializer.write_csv("Sites", path.string(), "\"Sites\",Bogus,Type,Name", options) == 3);
        REQUIRE(read_lines(path) == std::vector<std::string>{
            "\"Sites\",Type,Name",
            "\"Sites\",Heath,\"Heath, North\"",
            "\"Sites\",Wood,Ash Copse",
            "\"Sites\",Wood,Oak Wood",
        });
    }

    SECTION("an existing file is replaced") {
        write_text(path, "old contents\n");
        REQUIRE(serializer.write_csv("Sites", path.string(), "Type") == 3);
        REQUIRE(read_lines(path).front() == "Type");
        REQUIRE(read_lines(path).size() == 4);
    }
}

TEST_CASE("header control") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_append") / "sites.csv";

    SECTION("append adds rows without a header") {
        write_text(path, "Type\nHeath\n");
        CsvSerializer::Options options;
        options.append = true;
        REQUIRE(serializer.write_csv("Sites", path.string(), "Type", options) == 3);
        REQUIRE(read_lines(path) == std::vector<std::string>{"Type", "Heath", "Wood", "Heath", "Wood"});
    }

    SECTION("exclude_header") {
        CsvSerializer::Options options;
        options.exclude_header = true;
        REQUIRE(serializer.write_csv("Sites", path.string(), "Type", options) == 3);
        REQUIRE(read_lines(path) == std::vector<std::string>{"Wood", "Heath", "Wood"});
    }
}

TEST_CASE("nothing to export") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_nothing") / "sites.csv";

    SECTION("no known columns writes no file") {
        REQUIRE(serializer.write_csv("Sites", path.string(), "Bogus,Other") == 0);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("missing input") {
        REQUIRE(serializer.write_csv("mem:data/Nothing", path.string(), "Type") == -1);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("empty selection writes only the header") {
        store.set_selection("Sites", Selection{});
        REQUIRE(serializer.write_csv("Sites", path.string(), "Type,Name") == 0);
        REQUIRE(read_lines(path) == std::vector<std::string>{"Type,Name"});
    }

    SECTION("unwritable path") {
        const auto bad = path.parent_path() / "no_such_dir" / "sites.csv";
        REQUIRE(serializer.write_csv("Sites", bad.string(), "Type") == -1);
    }
}

TEST_CASE("selected rows only") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_selection") / "sites.csv";

    Selection last;
    last.insert(*all_features(store, "Sites").rbegin());
    store.set_selection("Sites", last);

    REQUIRE(serializer.write_csv("Sites", path.string(), "Name") == 1);
    REQUIRE(read_lines(path) == std::vector<std::string>{"Name", "Ash Copse"});
}

TEST_CASE("identity and geometry columns") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_system") / "sites.csv";

    const Selection ids = all_features(store, "Sites");
    store.set_selection("Sites", Selection{*ids.begin()});

    REQUIRE(serializer.write_csv("Sites", path.string(), "FID,Shape,Type") == 1);
    REQUIRE(read_lines(path) == std::vector<std::string>{
        "FID,Shape,Type",
        std::to_string(*ids.begin()) + ",POINT (1 2),Wood",
    });
}

TEST_CASE("header-only files") {
    FeatureStore store;
    CsvSerializer serializer(store);
    const auto directory = scratch_directory("csv_empty");

    REQUIRE(serializer.write_empty_csv((directory / "combined.csv").string(), "\"Sites\",Type,Area"));
    REQUIRE(read_lines(directory / "combined.csv") == std::vector<std::string>{"\"Sites\",Type,Area"});

    write_text(directory / "blank.csv", "stale\n");
    REQUIRE(serializer.write_empty_csv((directory / "blank.csv").string(), ""));
    REQUIRE(std::filesystem::file_size(directory / "blank.csv") == 0);

    REQUIRE_FALSE(serializer.write_empty_csv((directory / "missing" / "x.csv").string(), "A"));
}

TEST_CASE("written rows read back with their columns") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_read_back") / "sites.csv";

    REQUIRE(serializer.write_csv("Sites", path.string(), "Name,Type,Distance,Area") == 3);

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 4);
    const auto header = split_row(lines[0]);
    REQUIRE(header == std::vector<std::string>{"Name", "Type", "Distance", "Area"});
    for (size_t i = 1; i < lines.size(); ++i) {
        REQUIRE(split_row(lines[i]).size() == header.size());
    }
    REQUIRE(split_row(lines[2]) == std::vector<std::string>{"Heath, North", "Heath", "0", ""});
}

TEST_CASE("a write that runs out of space leaves no partial rows") {
    FeatureStore store;
    load_sites(store);
    CsvSerializer serializer(store);
    const auto path = scratch_directory("csv_out_of_space") / "sites.csv";

    SECTION("a new file is removed") {
        long rows = 0;
        {
            FileSizeLimit limit(32);
            rows = serializer.write_csv("Sites", path.string(), "Name,Distance,Area");
        }
        REQUIRE(rows == -1);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("an appended file keeps only its earlier rows") {
        write_text(path, "Type\nHeath\n");
        CsvSerializer::Options options;
        options.append = true;
        long rows = 0;
        {
            FileSizeLimit limit(32);
            rows = serializer.write_csv("Sites", path.string(), "Name,Type", options);
        }
        REQUIRE(rows == -1);
        REQUIRE(read_lines(path) == std::vector<std::string>{"Type", "Heath"});
    }
}
