#pragma once

#include "stipple/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

namespace stippler::stipple::core {

//! Per-pixel direction bias derived from local darkness. Both grids are CV_64FC1 and have the image shape.
struct FlowField {
	cv::Mat angle;     //!< Direction in degrees, [0, 360). 0 points along +x (right), 90 along +y (down).
	cv::Mat magnitude; //!< Length of the bias vector in pixels. Non-negative.
};

//! Polar form of a displacement.
struct FlowVector {
	double angle{0.0};     //!< Degrees, [0, 360).
	double magnitude{0.0}; //!< Euclidean length.
};

//! Magnitude given to background pixels, which point toward the image center.
static constexpr double BACKGROUND_FLOW_MAGNITUDE = 10.0;

//! atan2(dy, dx) in degrees normalised to [0, 360), and the length of (dy, dx).
FlowVector displacementToAngleMagnitude(double dy, double dx);

/*! Build the flow field of a grayscale image.
 *  The image is blurred (3x3, sigma 1) first. Then, per pixel:
 *   - background (255): point toward the image center with magnitude BACKGROUND_FLOW_MAGNITUDE.
 *   - full foreground (0): no bias.
 *   - otherwise: point toward the darkest pixel of the (2*windowSize+1)^2 window around it (clipped to the image).
 *     The magnitude is the distance to that pixel.
 *
 * \param [in]     image      CV_8UC1 image.
 * \param [in]     windowSize Half width of the darkest pixel search window. 0 disables the search (no bias on mid tones).
 * \param [in,out] debugger   Optional debug visualizer. Receives the blurred image, HSV and arrow plots.
 */
FlowField buildFlowField(const cv::Mat& image, int windowSize, DebugVisualizer* debugger = nullptr);

bool isValidFlowField(const FlowField& field, cv::Size size);

//! Hue = angle, value = magnitude normalised to the largest magnitude. Returns BGR.
cv::Mat flowFieldToBgr(const FlowField& field);

//! Draw one arrow every `step` pixels onto a copy of the image.
cv::Mat drawFlowArrows(const cv::Mat& image, const FlowField& field, const cv::Scalar& color, int step = 20);

} // namespace stippler::stipple::core
