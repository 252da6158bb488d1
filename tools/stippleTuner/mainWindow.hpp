#pragma once

#include "pipelineStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>
#include <string>

class QComboBox;
class QLabel;
class QSpinBox;

namespace stippler {

//! Paints a cv::Mat scaled to the widget, keeping the aspect ratio.
class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	QImage m_image{};
};

enum class TunerVariant { VoronoiFlow, WeightedNearest, WeightedNearestVariable };

/*! Controls on top (variant, stage, point count, iterations), the debug mosaic below and a one line run summary at the bottom.
 *  The window does not run anything itself; every control change is forwarded to a callback.
 */
class MainWindow : public QMainWindow {
public:
	using StepCallback       = std::function<void(PipelineStep)>;
	using VariantCallback    = std::function<void(TunerVariant)>;
	using ParametersCallback = std::function<void(int numPoints, int iterations)>;

	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSummary(const std::string& summary);
	void setParameters(int numPoints, int iterations); //!< Initial spin box values. Does not fire the callback.

	void setPipelineStepChangedCallback(StepCallback callback);
	void setVariantChangedCallback(VariantCallback callback);
	void setParametersChangedCallback(ParametersCallback callback);

	PipelineStep selectedPipelineStep() const;
	TunerVariant selectedVariant() const;

private:
	void buildLayout();
	void emitParameters();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_variantCombo{nullptr};
	QComboBox* m_stepCombo{nullptr};
	QSpinBox* m_pointsSpin{nullptr};
	QSpinBox* m_iterationsSpin{nullptr};
	QLabel* m_summaryLabel{nullptr};

	StepCallback m_stepChangedCallback{};
	VariantCallback m_variantChangedCallback{};
	ParametersCallback m_parametersChangedCallback{};
};

} // namespace stippler
