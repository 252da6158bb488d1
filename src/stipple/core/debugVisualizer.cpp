#include "stipple/core/debugVisualizer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace stippler::stipple::core {

static constexpr int HEADER_HEIGHT = 30;
static constexpr int LABEL_HEIGHT  = 22;
static constexpr int PADDING       = 4;

static const cv::Scalar MOSAIC_BACKGROUND(20, 20, 20);
static const cv::Scalar BAR_BACKGROUND(0, 0, 0);
static const cv::Scalar BAR_TEXT(255, 255, 255);

//! Height of the image area of a tile, taken from the first non-empty image of the stage.
static int imageAreaHeight(const DebugStage& stage) {
	const int fallback = DebugVisualizer::TILE_WIDTH * 3 / 4;
	for (const auto& step: stage.images) {
		if (!step.image.empty()) {
			const auto height = std::lround(static_cast<double>(DebugVisualizer::TILE_WIDTH) * step.image.rows / step.image.cols);
			return std::clamp(static_cast<int>(height), 16, 2 * DebugVisualizer::TILE_WIDTH);
		}
	}
	return fallback;
}

static void drawBar(cv::Mat& target, const cv::Rect& bar, const std::string& text, double fontScale) {
	cv::rectangle(target, bar, BAR_BACKGROUND, cv::FILLED);
	const cv::Point baseline(bar.x + PADDING, bar.y + bar.height - 7);
	cv::putText(target, text, baseline, cv::FONT_HERSHEY_SIMPLEX, fontScale, BAR_TEXT, 1, cv::LINE_AA);
}

//! Scale the image into the cell, keeping its aspect ratio. Nearest neighbour when enlarging so single-pixel dots stay crisp.
static void drawTile(cv::Mat& cell, const DebugStep& step) {
	drawBar(cell, cv::Rect(0, 0, cell.cols, LABEL_HEIGHT), step.name, 0.5);
	if (step.image.empty()) {
		return;
	}

	const cv::Rect area(PADDING, LABEL_HEIGHT + PADDING, cell.cols - 2 * PADDING, cell.rows - LABEL_HEIGHT - 2 * PADDING);
	const cv::Mat bgr  = DebugVisualizer::toBgr8U(step.image);
	const double scale = std::min(static_cast<double>(area.width) / bgr.cols, static_cast<double>(area.height) / bgr.rows);
	const cv::Size size(std::clamp(static_cast<int>(bgr.cols * scale), 1, area.width), std::clamp(static_cast<int>(bgr.rows * scale), 1, area.height));

	cv::Mat scaled;
	cv::resize(bgr, scaled, size, 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

	const cv::Point offset(area.x + (area.width - size.width) / 2, area.y + (area.height - size.height) / 2);
	scaled.copyTo(cell(cv::Rect(offset, size)));
}

void DebugVisualizer::beginStage(std::string name) {
	endStage();
	m_currentStage.name = std::move(name);
	m_hasActiveStage    = true;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		beginStage({});
	}
	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.push_back(std::move(m_currentStage));
	m_currentStage   = {};
	m_hasActiveStage = false;
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = {};
	m_hasActiveStage = false;
}

std::vector<std::size_t> DebugVisualizer::pickSteps(const std::size_t count, const std::size_t limit) {
	std::vector<std::size_t> picked;
	if (count == 0u || limit == 0u) {
		return picked;
	}
	if (count <= limit) {
		for (std::size_t i = 0; i < count; ++i) {
			picked.push_back(i);
		}
		return picked;
	}
	if (limit == 1u) {
		return {count - 1u};
	}

	const double stride = static_cast<double>(count - 1u) / static_cast<double>(limit - 1u);
	for (std::size_t i = 0; i < limit; ++i) {
		picked.push_back(static_cast<std::size_t>(std::lround(stride * static_cast<double>(i))));
	}
	return picked;
}

cv::Mat DebugVisualizer::buildMosaic() {
	endStage();

	static constexpr std::size_t MAX_TILES = MAX_TILES_PER_ROW * MAX_ROWS_PER_STAGE;

	// Layout pass: which images are shown per stage and how tall each band gets.
	struct Band {
		const DebugStage* stage;
		std::vector<std::size_t> steps;
		int tileHeight;
		int rows;
	};
	std::vector<Band> bands;
	std::size_t widestRow = 0u;
	int mosaicHeight      = 0;

	for (const auto& stage: m_stages) {
		if (stage.images.empty()) {
			continue;
		}
		Band band{&stage, pickSteps(stage.images.size(), MAX_TILES), LABEL_HEIGHT + imageAreaHeight(stage) + 2 * PADDING, 0};
		band.rows = static_cast<int>((band.steps.size() + MAX_TILES_PER_ROW - 1) / MAX_TILES_PER_ROW);

		widestRow = std::max(widestRow, std::min<std::size_t>(band.steps.size(), MAX_TILES_PER_ROW));
		mosaicHeight += HEADER_HEIGHT + band.rows * band.tileHeight;
		bands.push_back(std::move(band));
	}
	if (bands.empty()) {
		return {};
	}

	cv::Mat mosaic(mosaicHeight, static_cast<int>(widestRow) * TILE_WIDTH, CV_8UC3, MOSAIC_BACKGROUND);

	int y = 0;
	for (std::size_t b = 0; b < bands.size(); ++b) {
		const Band& band       = bands[b];
		const std::string name = band.stage->name.empty() ? "Stage " + std::to_string(b + 1) : band.stage->name;
		const std::string info = band.steps.size() < band.stage->images.size()
		                                 ? std::to_string(band.steps.size()) + " of " + std::to_string(band.stage->images.size())
		                                 : std::to_string(band.stage->images.size());
		drawBar(mosaic, cv::Rect(0, y, mosaic.cols, HEADER_HEIGHT), name + " (" + info + ")", 0.7);
		y += HEADER_HEIGHT;

		for (std::size_t i = 0; i < band.steps.size(); ++i) {
			const int column = static_cast<int>(i % MAX_TILES_PER_ROW);
			const int row    = static_cast<int>(i / MAX_TILES_PER_ROW);
			cv::Mat cell     = mosaic(cv::Rect(column * TILE_WIDTH, y + row * band.tileHeight, TILE_WIDTH, band.tileHeight));
			drawTile(cell, band.stage->images[band.steps[i]]);
		}
		y += band.rows * band.tileHeight;
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat scaled;
	if (in.depth() == CV_8U) {
		scaled = in;
	} else {
		// Flow grids and accumulators are doubles with arbitrary range.
		cv::normalize(in.reshape(1), scaled, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
		scaled = scaled.reshape(in.channels());
	}

	cv::Mat bgr;
	switch (scaled.channels()) {
	case 1:
		cv::cvtColor(scaled, bgr, cv::COLOR_GRAY2BGR);
		break;
	case 4:
		cv::cvtColor(scaled, bgr, cv::COLOR_BGRA2BGR);
		break;
	default:
		bgr = scaled.clone();
		break;
	}
	return bgr;
}

} // namespace stippler::stipple::core
