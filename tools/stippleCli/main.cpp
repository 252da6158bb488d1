#include "stipple/core/errors.hpp"
#include "stipple/stippleEngine.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace stippler::stipple {

static void printUsage(const char* program) {
	std::cerr << "Usage: " << program << " <image> [options]\n"
	          << "  --out <file.svg>            SVG output (default: <image>.svg)\n"
	          << "  --png <file.png>            Raster preview output\n"
	          << "  --variant <voronoi-flow|weighted-nearest>\n"
	          << "  --variable-radius <0|1>     Weighted nearest only\n"
	          << "  --points <n>  --iterations <n>  --dpu <x>  --radius <x>  --min-radius <x>  --window <n>\n"
	          << "  --sampling <uniform|foreground>  --seed <n>  --max-attempts <n>\n"
	          << "  --debug-dir <dir>  --console-debug <0|1>  --txt-debug <0|1>  --visualize <0|1>\n";
}

static bool parseFlag(const std::string& value) {
	if (value == "1" || value == "true" || value == "on") {
		return true;
	}
	if (value == "0" || value == "false" || value == "off") {
		return false;
	}
	throw core::ConfigurationError("Expected 0 or 1, got '" + value + "'");
}

//! Apply one "--key value" pair. Returns false for an unknown key.
static bool applyOption(const std::string& key, const std::string& value, StippleConfig& config, DebugOptions& debug) {
	if (key == "points") {
		config.numPoints = std::stoi(value);
	} else if (key == "iterations") {
		config.iterations = std::stoi(value);
	} else if (key == "dpu") {
		config.dotsPerUnit = std::stod(value);
	} else if (key == "radius") {
		config.pointUnitRadius = std::stod(value);
	} else if (key == "min-radius") {
		config.minPointUnitRadius = std::stod(value);
	} else if (key == "window") {
		config.preprocessWindowSize = std::stoi(value);
	} else if (key == "variant") {
		if (value == "voronoi-flow") {
			config.variant = RelaxationVariant::VoronoiFlow;
		} else if (value == "weighted-nearest") {
			config.variant = RelaxationVariant::WeightedNearest;
		} else {
			throw core::ConfigurationError("Unknown variant '" + value + "'");
		}
	} else if (key == "variable-radius") {
		config.variableRadius = parseFlag(value);
	} else if (key == "sampling") {
		if (value == "uniform") {
			config.sampling = core::SamplingStrategy::Uniform;
		} else if (value == "foreground") {
			config.sampling = core::SamplingStrategy::Foreground;
		} else {
			throw core::ConfigurationError("Unknown sampling strategy '" + value + "'");
		}
	} else if (key == "seed") {
		config.seed = std::stoull(value);
	} else if (key == "max-attempts") {
		config.maxSamplingAttempts = std::stoull(value);
	} else if (key == "debug-dir") {
		debug.debugDir = value;
	} else if (key == "console-debug") {
		debug.consoleDebug = parseFlag(value);
	} else if (key == "txt-debug") {
		debug.txtDebug = parseFlag(value);
	} else if (key == "visualize") {
		debug.visualizeDebug = parseFlag(value);
	} else {
		return false;
	}
	return true;
}

static int run(int argc, char** argv) {
	if (argc < 2 || std::string(argv[1]) == "--help") {
		printUsage(argv[0]);
		return argc < 2 ? 1 : 0;
	}

	const std::filesystem::path inputPath = argv[1];
	std::filesystem::path svgPath         = std::filesystem::path(inputPath).replace_extension(".svg");
	std::filesystem::path pngPath{};

	StippleConfig config;
	DebugOptions debug;

	for (int i = 2; i < argc; i += 2) {
		const std::string arg = argv[i];
		if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
			std::cerr << "[Error] Expected '--key value', got '" << arg << "'\n";
			printUsage(argv[0]);
			return 1;
		}

		const std::string key   = arg.substr(2);
		const std::string value = argv[i + 1];
		if (key == "out") {
			svgPath = value;
		} else if (key == "png") {
			pngPath = value;
		} else if (!applyOption(key, value, config, debug)) {
			std::cerr << "[Error] Unknown option '" << arg << "'\n";
			printUsage(argv[0]);
			return 1;
		}
	}

	const cv::Mat image = cv::imread(inputPath.string(), cv::IMREAD_GRAYSCALE);
	if (image.empty()) {
		std::cerr << "[Error] Failed to load image: " << inputPath << "\n";
		return 1;
	}

	StippleEngine engine(image, config, debug);
	const StippleResult& result = engine.stipple();

	engine.exportToSvg(svgPath);
	if (!pngPath.empty()) {
		engine.exportToPng(pngPath);
	}

	std::cout << "Wrote " << result.stipples.size() << " of " << result.stats.sampled << " points to " << svgPath.string() << "\n";
	return 0;
}

} // namespace stippler::stipple

int main(int argc, char** argv) {
	try {
		return stippler::stipple::run(argc, argv);
	} catch (const stippler::stipple::core::StippleError& e) {
		std::cerr << "[Error] " << e.what() << "\n";
	} catch (const std::invalid_argument& e) {
		std::cerr << "[Error] Invalid number: " << e.what() << "\n";
	} catch (const std::out_of_range& e) {
		std::cerr << "[Error] Number out of range: " << e.what() << "\n";
	}
	return 1;
}
