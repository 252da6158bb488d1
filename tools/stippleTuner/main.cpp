#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <QApplication>

#include <opencv2/imgcodecs.hpp>

#include "analyser.hpp"
#include "mainWindow.hpp"

namespace stipple = stippler::stipple;

static void applyVariant(stipple::Analyser& analyser, const stippler::TunerVariant variant) {
	switch (variant) {
	case stippler::TunerVariant::VoronoiFlow:
		analyser.setVariant(stipple::RelaxationVariant::VoronoiFlow, false);
		break;
	case stippler::TunerVariant::WeightedNearest:
		analyser.setVariant(stipple::RelaxationVariant::WeightedNearest, false);
		break;
	case stippler::TunerVariant::WeightedNearestVariable:
		analyser.setVariant(stipple::RelaxationVariant::WeightedNearest, true);
		break;
	}
}

// Usage: stippleTuner <image> [numPoints] [iterations]
// Every control change reruns the full pipeline and shows the debug mosaic of the selected stage.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <image> [numPoints] [iterations]\n";
		return 1;
	}

	const std::filesystem::path inputPath = argv[1];
	const cv::Mat image                   = cv::imread(inputPath.string(), cv::IMREAD_GRAYSCALE);
	if (image.empty()) {
		std::cerr << "[Error] Failed to load image: " << inputPath << "\n";
		return 1;
	}

	stipple::StippleConfig config;
	config.numPoints  = 2000;
	config.iterations = 20;
	try {
		if (argc > 2) {
			config.numPoints = std::stoi(argv[2]);
		}
		if (argc > 3) {
			config.iterations = std::stoi(argv[3]);
		}
	} catch (const std::logic_error& e) {
		std::cerr << "[Error] Invalid number: " << e.what() << "\n";
		return 1;
	}

	stipple::Analyser analyser(image, config);
	stippler::MainWindow window;
	window.setParameters(config.numPoints, config.iterations);

	const auto refresh = [&]() {
		const stipple::Analysis analysis = analyser.analyse(window.selectedPipelineStep());
		window.setImage(analysis.mosaic);
		window.setSummary(analysis.summary);
	};

	window.setPipelineStepChangedCallback([&](stippler::PipelineStep) { refresh(); });
	window.setVariantChangedCallback([&](const stippler::TunerVariant variant) {
		applyVariant(analyser, variant);
		refresh();
	});
	window.setParametersChangedCallback([&](const int numPoints, const int iterations) {
		if (numPoints == analyser.config().numPoints && iterations == analyser.config().iterations) {
			return;
		}
		analyser.setPointBudget(numPoints, iterations);
		refresh();
	});

	window.resize(1400, 900);
	refresh();
	window.show();

	return application.exec();
}
