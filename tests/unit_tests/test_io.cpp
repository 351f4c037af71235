#include "testing_utils.hpp"
#include <gtest/gtest.h>

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include "io.hpp"


std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream file{path};
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}


class TestSaveTesseroids : public testing::Test {
protected:
    void TearDown() override {
        std::filesystem::remove(path);
    }

    std::filesystem::path path = temporary_file("tesseroids.txt");
    std::vector<Tesseroid> model{
        {-180, -178, 88, 90, -4000, -8000, {{"density", 1020}, {"vp", 1500}, {"vs", 0}}},
        {-180, -178, 88, 90, -8000, -8500.5, {{"density", 2000}, {"vp", 2000}, {"vs", 1000}}}};
};

TEST_F(TestSaveTesseroids, TestOneLinePerTesseroid) {
    save_tesseroids(model, path);
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "# west east south north top bottom density vp vs");
    EXPECT_EQ(lines[1], "-180 -178 88 90 -4000 -8000 1020 1500 0");
    EXPECT_EQ(lines[2], "-180 -178 88 90 -8000 -8500.5 2000 2000 1000");
}

TEST_F(TestSaveTesseroids, TestSavedValuesCanBeReadBack) {
    save_tesseroids(model, path);
    std::ifstream file{path};
    std::string header;
    std::getline(file, header);
    Tesseroid t;
    double density, vp, vs;
    file >> t.west >> t.east >> t.south >> t.north >> t.top >> t.bottom >> density >> vp >> vs;
    t.props = {{"density", density}, {"vp", vp}, {"vs", vs}};
    EXPECT_EQ(t, model[0]);
}

TEST(SaveTesseroidsErrors, TestInvalidPathThrows) {
    EXPECT_THROW(save_tesseroids({}, "/Idonotexist/tesseroids.txt"), std::runtime_error);
}


class TestSaveXYZ : public testing::Test {
protected:
    void TearDown() override {
        std::filesystem::remove(path);
    }

    std::filesystem::path path = temporary_file("grid.xyz");
};

TEST_F(TestSaveXYZ, TestRowsAreWrittenOneAfterAnother) {
    SurferGrid grid{{0, 1}, {10, 20}, Eigen::MatrixXd(2, 2), 0, 4};
    grid.values << 1, 2, std::numeric_limits<double>::quiet_NaN(), 4;
    save_xyz(grid, path);
    std::vector<std::string> expected{"0 10 1", "1 10 2", "0 20 nan", "1 20 4"};
    EXPECT_EQ(read_lines(path), expected);
}

TEST(SaveXYZErrors, TestInvalidPathThrows) {
    SurferGrid grid{{0}, {0}, Eigen::MatrixXd::Zero(1, 1), 0, 0};
    EXPECT_THROW(save_xyz(grid, "/Idonotexist/grid.xyz"), std::runtime_error);
}


TEST(PrintTesseroid, TestFormat) {
    Tesseroid t{0, 2, -2, 0, 10, -90, {{"density", 2670}}};
    std::ostringstream os;
    os << t;
    EXPECT_EQ(os.str(), "Tesseroid(w = 0, e = 2, s = -2, n = 0, top = 10, bottom = -90, "
                        "density = 2670)");
    EXPECT_EQ(tesseroid_height(t), 100);
}

TEST(PrintOptions, TestIniLayout) {
    Crust2TessOptions options{"crust2.tar.gz", "model.txt"};
    std::ostringstream os;
    os << options;
    EXPECT_EQ(os.str(), "[crust2]\narchive = crust2.tar.gz\noutput = model.txt\n\n");
}


class TestParseOptions : public testing::Test {
protected:
    TestParseOptions() {
        // clang-format off
        general.add_options()
            ("crust2.archive,a", boost::program_options::value(&options.archive_path)
                ->default_value(std::filesystem::path("crust2.tar.gz"), "crust2.tar.gz"), "Archive")
            ("crust2.output,o", boost::program_options::value(&options.output_path)->required(),
                "Output");
        // clang-format on
    }

    void TearDown() override {
        std::filesystem::remove(config_path);
    }

    std::optional<boost::program_options::variables_map> parse(std::vector<std::string> args) {
        args.insert(args.begin(), "crust2tess");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_options(static_cast<int>(argv.size()), argv.data(), general, "Test program");
    }

    Crust2TessOptions options;
    boost::program_options::options_description general{"Config/keyword arguments"};
    std::filesystem::path config_path = temporary_file("options.cfg");
};

TEST_F(TestParseOptions, TestCommandLineOptionsAreStored) {
    auto result = parse({"-o", "model.txt"});
    ASSERT_TRUE(result);
    EXPECT_EQ(options.output_path.string(), "model.txt");
    EXPECT_EQ(options.archive_path.string(), "crust2.tar.gz");
}

TEST_F(TestParseOptions, TestCommandLineOverridesConfigFile) {
    std::ofstream{config_path} << "[crust2]\narchive = other.tar.gz\noutput = from_file.txt\n";
    auto result = parse({config_path.string(), "--crust2.output", "model.txt"});
    ASSERT_TRUE(result);
    EXPECT_EQ(options.output_path.string(), "model.txt");
    EXPECT_EQ(options.archive_path.string(), "other.tar.gz");
}

TEST_F(TestParseOptions, TestHelpReturnsEmpty) {
    testing::internal::CaptureStdout();
    auto result = parse({"--help"});
    auto usage = testing::internal::GetCapturedStdout();
    EXPECT_FALSE(result);
    EXPECT_NE(usage.find("--crust2.output"), std::string::npos);
}

TEST_F(TestParseOptions, TestMissingRequiredOptionThrows) {
    EXPECT_THROW(parse({}), boost::program_options::required_option);
}

TEST_F(TestParseOptions, TestMissingConfigFileThrows) {
    EXPECT_THROW(parse({"/Idonotexist/options.cfg", "-o", "model.txt"}),
                 boost::program_options::error);
}
