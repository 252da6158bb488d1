#include "stipple/core/errors.hpp"
#include "stipple/core/exporter.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace stippler::stipple::core {
namespace gtest {

//! Fresh directory below the system temp directory. Removed again in the destructor.
class TempDir {
public:
	explicit TempDir(const std::string& name) : m_path(std::filesystem::temp_directory_path() / ("stipple_" + name)) {
		std::filesystem::remove_all(m_path);
		std::filesystem::create_directories(m_path);
	}
	~TempDir() {
		std::error_code ec;
		std::filesystem::remove_all(m_path, ec);
	}

	const std::filesystem::path& path() const {
		return m_path;
	}

private:
	std::filesystem::path m_path;
};

static std::size_t countOccurrences(const std::string& text, const std::string& needle) {
	std::size_t count = 0u;
	for (std::size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
		++count;
	}
	return count;
}

static std::string readFile(const std::filesystem::path& path) {
	std::ifstream file(path);
	std::stringstream buffer;
	buffer << file.rdbuf();
	return buffer.str();
}

TEST(ExporterUnit, SortForDrawing_BySquaredDistanceFromOrigin) {
	const StippleSet input = {
	        {{3.0, 4.0}, 1.0}, // 25
	        {{1.0, 0.0}, 1.0}, // 1
	        {{0.0, 5.0}, 2.0}, // 25, keeps input order after (3,4)
	        {{2.0, 2.0}, 1.0}, // 8
	};

	const StippleSet sorted = sortForDrawing(input);
	ASSERT_EQ(sorted.size(), 4u);
	EXPECT_EQ(sorted[0].position, cv::Point2d(1.0, 0.0));
	EXPECT_EQ(sorted[1].position, cv::Point2d(2.0, 2.0));
	EXPECT_EQ(sorted[2].position, cv::Point2d(3.0, 4.0));
	EXPECT_EQ(sorted[3].position, cv::Point2d(0.0, 5.0));
}

TEST(ExporterUnit, Svg_RootMatchesImageAndOneCirclePerPoint) {
	const StippleSet stipples = {{{12.0, 7.0}, 1.5}, {{1.0, 2.0}, 3.0}};
	const std::string svg     = toSvg(stipples, cv::Size(40, 30));

	EXPECT_NE(svg.find(R"(width="40")"), std::string::npos);
	EXPECT_NE(svg.find(R"(height="30")"), std::string::npos);
	EXPECT_NE(svg.find(R"(viewBox="0 0 40 30")"), std::string::npos);
	EXPECT_EQ(countOccurrences(svg, "<circle"), 2u);
	EXPECT_NE(svg.find("</svg>"), std::string::npos);

	// Columns map to cx, rows to cy. The point closer to the origin comes first.
	const std::size_t first  = svg.find(R"(cx="1" cy="2" r="3")");
	const std::size_t second = svg.find(R"(cx="12" cy="7" r="1.5")");
	ASSERT_NE(first, std::string::npos);
	ASSERT_NE(second, std::string::npos);
	EXPECT_LT(first, second);
}

TEST(ExporterUnit, Svg_Empty) {
	const std::string svg = toSvg({}, cv::Size(5, 5));
	EXPECT_EQ(countOccurrences(svg, "<circle"), 0u);
	EXPECT_NE(svg.find("<svg"), std::string::npos);
}

TEST(ExporterUnit, WriteSvg_WritesFileWithoutLeftovers) {
	const TempDir dir("exporter_svg");
	const auto path = dir.path() / "out.svg";

	const StippleSet stipples = {{{2.0, 3.0}, 1.0}};
	writeSvg(path, stipples, cv::Size(10, 10));

	ASSERT_TRUE(std::filesystem::exists(path));
	EXPECT_EQ(readFile(path), toSvg(stipples, cv::Size(10, 10)));

	const auto files = std::distance(std::filesystem::directory_iterator(dir.path()), std::filesystem::directory_iterator{});
	EXPECT_EQ(files, 1);
}

TEST(ExporterUnit, WriteSvg_MissingDirectory_Throws) {
	const TempDir dir("exporter_missing");
	const auto path = dir.path() / "does" / "not" / "exist.svg";

	EXPECT_THROW(writeSvg(path, {}, cv::Size(10, 10)), ExportError);
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ExporterUnit, Preview_BlackDotsOnWhite) {
	const StippleSet stipples = {{{5.0, 4.0}, 2.0}};
	const cv::Mat preview     = renderPreview(stipples, cv::Size(12, 10));

	ASSERT_EQ(preview.size(), cv::Size(12, 10));
	ASSERT_EQ(preview.type(), CV_8UC3);
	EXPECT_EQ(preview.at<cv::Vec3b>(4, 5), cv::Vec3b(0, 0, 0));
	EXPECT_EQ(preview.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 255, 255));
}

TEST(ExporterUnit, WritePng_Readable) {
	const TempDir dir("exporter_png");
	const auto path = dir.path() / "preview.png";

	writePng(path, {{{5.0, 4.0}, 2.0}}, cv::Size(12, 10));

	const cv::Mat loaded = cv::imread(path.string(), cv::IMREAD_COLOR);
	ASSERT_FALSE(loaded.empty());
	EXPECT_EQ(loaded.size(), cv::Size(12, 10));
	EXPECT_FALSE(std::filesystem::exists(dir.path() / "preview.partial.png"));
}

} // namespace gtest
} // namespace stippler::stipple::core
