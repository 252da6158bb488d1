#include "stipple/core/flowField.hpp"

#include "stipple/core/geometry.hpp"
#include "stipple/core/visualization.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>

namespace stippler::stipple::core {

FlowVector displacementToAngleMagnitude(const double dy, const double dx) {
	double angle = std::atan2(dy, dx) * 180.0 / std::numbers::pi;
	if (angle < 0.0) {
		angle += 360.0;
	}
	if (angle >= 360.0) {
		angle = 0.0;
	}
	return {angle, std::hypot(dx, dy)};
}

namespace {

//! Fills a stripe of rows of the flow field. Rows are independent so stripes can run in parallel.
class FlowRowBody : public cv::ParallelLoopBody {
public:
	FlowRowBody(const cv::Mat& blurred, int windowSize, FlowField& field) : m_blurred(blurred), m_windowSize(windowSize), m_field(field) {
		m_centerX = static_cast<double>(blurred.cols - 1) / 2.0;
		m_centerY = static_cast<double>(blurred.rows - 1) / 2.0;
	}

	void operator()(const cv::Range& rows) const override {
		const cv::Rect bounds(0, 0, m_blurred.cols, m_blurred.rows);

		for (int y = rows.start; y < rows.end; ++y) {
			const uchar* src = m_blurred.ptr<uchar>(y);
			double* angle    = m_field.angle.ptr<double>(y);
			double* mag      = m_field.magnitude.ptr<double>(y);

			for (int x = 0; x < m_blurred.cols; ++x) {
				const uchar value = src[x];

				if (value == BACKGROUND) {
					const FlowVector home = displacementToAngleMagnitude(m_centerY - y, m_centerX - x);
					angle[x]              = home.angle;
					mag[x]                = BACKGROUND_FLOW_MAGNITUDE;
					continue;
				}
				if (value == 0 || m_windowSize <= 0) {
					angle[x] = 0.0;
					mag[x]   = 0.0;
					continue;
				}

				// Window clipped to the image. minMaxLoc reports the first minimum in row-major order.
				const cv::Rect window = cv::Rect(x - m_windowSize, y - m_windowSize, 2 * m_windowSize + 1, 2 * m_windowSize + 1) & bounds;
				cv::Point minLoc;
				cv::minMaxLoc(m_blurred(window), nullptr, nullptr, &minLoc, nullptr);

				const FlowVector toDarkest = displacementToAngleMagnitude(window.y + minLoc.y - y, window.x + minLoc.x - x);
				angle[x]                   = toDarkest.angle;
				mag[x]                     = toDarkest.magnitude;
			}
		}
	}

private:
	const cv::Mat& m_blurred;
	int m_windowSize;
	FlowField& m_field;
	double m_centerX{0.0};
	double m_centerY{0.0};
};

} // namespace

FlowField buildFlowField(const cv::Mat& image, const int windowSize, DebugVisualizer* debugger) {
	CV_Assert(!image.empty() && image.type() == CV_8UC1);

	if (debugger) {
		debugger->beginStage("Flow Field");
		debugger->add("Input", image);
	}

	cv::Mat blurred;
	cv::GaussianBlur(image, blurred, cv::Size(3, 3), 1.0);
	if (debugger)
		debugger->add("Gaussian Blur", blurred);

	FlowField field{cv::Mat::zeros(image.size(), CV_64FC1), cv::Mat::zeros(image.size(), CV_64FC1)};
	cv::parallel_for_(cv::Range(0, image.rows), FlowRowBody(blurred, windowSize, field));

	if (debugger) {
		debugger->add("Flow HSV", flowFieldToBgr(field));
		debugger->add("Flow Arrows", drawFlowArrows(image, field, cv::Scalar(0, 0, 255)));
		debugger->endStage();
	}

	return field;
}

bool isValidFlowField(const FlowField& field, const cv::Size size) {
	return !field.angle.empty() && !field.magnitude.empty() && field.angle.size() == size && field.magnitude.size() == size &&
	       field.angle.type() == CV_64FC1 && field.magnitude.type() == CV_64FC1;
}

cv::Mat flowFieldToBgr(const FlowField& field) {
	double maxMagnitude = 0.0;
	cv::minMaxLoc(field.magnitude, nullptr, &maxMagnitude);

	cv::Mat hue, value;
	field.angle.convertTo(hue, CV_8U, 179.0 / 360.0);
	field.magnitude.convertTo(value, CV_8U, 255.0 / (maxMagnitude + 1e-10));
	const cv::Mat saturation(field.angle.size(), CV_8UC1, cv::Scalar(255));

	cv::Mat hsv, bgr;
	cv::merge(std::vector<cv::Mat>{hue, saturation, value}, hsv);
	cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
	return bgr;
}

cv::Mat drawFlowArrows(const cv::Mat& image, const FlowField& field, const cv::Scalar& color, const int step) {
	cv::Mat out = toBgr(image);
	const int stride = std::max(1, step);

	for (int y = 0; y < out.rows; y += stride) {
		for (int x = 0; x < out.cols; x += stride) {
			const double magnitude = field.magnitude.at<double>(y, x);
			if (magnitude <= 0.0) {
				continue;
			}
			const double radians = field.angle.at<double>(y, x) * std::numbers::pi / 180.0;
			const int dx         = static_cast<int>(magnitude * std::cos(radians));
			const int dy         = static_cast<int>(magnitude * std::sin(radians));
			cv::arrowedLine(out, cv::Point(x, y), cv::Point(x + dx, y + dy), color, 1, cv::LINE_8, 0, 0.5);
		}
	}
	return out;
}

} // namespace stippler::stipple::core
