#include "mainWindow.hpp"

#include "stipple/core/debugVisualizer.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <utility>

namespace stippler {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	if (mat.empty()) {
		m_image = {};
	} else {
		cv::Mat rgb;
		cv::cvtColor(stipple::core::DebugVisualizer::toBgr8U(mat), rgb, cv::COLOR_BGR2RGB);
		m_image = QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
	}
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);
	if (m_image.isNull()) {
		return;
	}

	// Stipple dots are often a single pixel wide. Fast (nearest) scaling keeps them visible.
	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::FastTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Stipple Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	m_matrixView->setMat(image);
}

void MainWindow::setSummary(const std::string& summary) {
	m_summaryLabel->setText(QString::fromStdString(summary));
}

void MainWindow::setParameters(const int numPoints, const int iterations) {
	const QSignalBlocker pointsBlocker(m_pointsSpin);
	const QSignalBlocker iterationsBlocker(m_iterationsSpin);
	m_pointsSpin->setValue(numPoints);
	m_iterationsSpin->setValue(iterations);
}

void MainWindow::setPipelineStepChangedCallback(StepCallback callback) {
	m_stepChangedCallback = std::move(callback);
}

void MainWindow::setVariantChangedCallback(VariantCallback callback) {
	m_variantChangedCallback = std::move(callback);
}

void MainWindow::setParametersChangedCallback(ParametersCallback callback) {
	m_parametersChangedCallback = std::move(callback);
}

PipelineStep MainWindow::selectedPipelineStep() const {
	return static_cast<PipelineStep>(m_stepCombo->currentData().toInt());
}

TunerVariant MainWindow::selectedVariant() const {
	return static_cast<TunerVariant>(m_variantCombo->currentData().toInt());
}

void MainWindow::emitParameters() {
	if (m_parametersChangedCallback) {
		m_parametersChangedCallback(m_pointsSpin->value(), m_iterationsSpin->value());
	}
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controls   = new QHBoxLayout();

	m_variantCombo = new QComboBox(rootWidget);
	m_variantCombo->addItem("Voronoi + Flow", static_cast<int>(TunerVariant::VoronoiFlow));
	m_variantCombo->addItem("Weighted Nearest", static_cast<int>(TunerVariant::WeightedNearest));
	m_variantCombo->addItem("Weighted Nearest (variable radius)", static_cast<int>(TunerVariant::WeightedNearestVariable));

	m_stepCombo = new QComboBox(rootWidget);
	m_stepCombo->addItem("All", static_cast<int>(PipelineStep::All));
	m_stepCombo->addItem("Flow Field", static_cast<int>(PipelineStep::FlowField));
	m_stepCombo->addItem("Sampling", static_cast<int>(PipelineStep::Sampling));
	m_stepCombo->addItem("Relaxation", static_cast<int>(PipelineStep::Relaxation));
	m_stepCombo->addItem("Post-processing", static_cast<int>(PipelineStep::PostProcess));

	m_pointsSpin = new QSpinBox(rootWidget);
	m_pointsSpin->setRange(1, 200000);
	m_pointsSpin->setSingleStep(100);

	m_iterationsSpin = new QSpinBox(rootWidget);
	m_iterationsSpin->setRange(1, 500);

	connect(m_variantCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_variantChangedCallback) {
			m_variantChangedCallback(selectedVariant());
		}
	});
	connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_stepChangedCallback) {
			m_stepChangedCallback(selectedPipelineStep());
		}
	});
	// Spin boxes report on editingFinished only, not on every keystroke.
	connect(m_pointsSpin, &QSpinBox::editingFinished, this, [this]() { emitParameters(); });
	connect(m_iterationsSpin, &QSpinBox::editingFinished, this, [this]() { emitParameters(); });

	controls->addWidget(new QLabel("Variant:", rootWidget));
	controls->addWidget(m_variantCombo);
	controls->addSpacing(16);
	controls->addWidget(new QLabel("Stage:", rootWidget));
	controls->addWidget(m_stepCombo);
	controls->addSpacing(16);
	controls->addWidget(new QLabel("Points:", rootWidget));
	controls->addWidget(m_pointsSpin);
	controls->addWidget(new QLabel("Iterations:", rootWidget));
	controls->addWidget(m_iterationsSpin);
	controls->addStretch(1);

	m_matrixView   = new CvMatrixView(rootWidget);
	m_summaryLabel = new QLabel(rootWidget);

	rootLayout->addLayout(controls);
	rootLayout->addWidget(m_matrixView, 1);
	rootLayout->addWidget(m_summaryLabel);

	setCentralWidget(rootWidget);
}

} // namespace stippler
