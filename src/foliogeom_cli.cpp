#include <FolioGeomAPI.h>
#include <iostream>
#include <string>
#include <fstream>
#include <cstdint>

using namespace std;

struct Arguments {
    string inputPath;
    string outputBase;
    bool valid = false;
    bool verbose = false;
    bool debug = false;

    string side = "auto";             // auto, left, right, center
    int splitMargin = 50;
    int contourBorder = 150;
    double coverageThreshold = 0.90;
    double dpi = 0.0;                 // 0 = unknown
    bool smartCrop = false;
    bool forceFold = false;
    bool noSplit = false;
    bool trimmedFit = false;
    bool polygonOnly = false;
    bool quality = false;
    uint64_t seed = 42;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    try {
        for (int i = 1; i < argc; i++) {
            string arg = argv[i];
            if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
                args.inputPath = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
                args.outputBase = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-d" || arg == "--debug") {
                args.debug = true;
            } else if ((arg == "--side") && (i + 1 < argc)) {
                args.side = argv[++i];
            } else if ((arg == "-m" || arg == "--margin") && (i + 1 < argc)) {
                args.splitMargin = stoi(argv[++i]);
            } else if ((arg == "--contour-border") && (i + 1 < argc)) {
                args.contourBorder = stoi(argv[++i]);
            } else if ((arg == "--coverage-threshold") && (i + 1 < argc)) {
                args.coverageThreshold = stod(argv[++i]);
            } else if ((arg == "--dpi") && (i + 1 < argc)) {
                args.dpi = stod(argv[++i]);
            } else if (arg == "--smart-crop") {
                args.smartCrop = true;
            } else if (arg == "--force-fold") {
                args.forceFold = true;
            } else if (arg == "--no-split") {
                args.noSplit = true;
            } else if (arg == "--trimmed-fit") {
                args.trimmedFit = true;
            } else if (arg == "--polygon-only") {
                args.polygonOnly = true;
            } else if (arg == "--quality") {
                args.quality = true;
            } else if ((arg == "--seed") && (i + 1 < argc)) {
                args.seed = stoull(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                return args; // Will trigger usage display
            }
        }
    } catch (const exception& e) {
        cerr << "[ERROR] Invalid numeric argument: " << e.what() << endl;
        return args;
    }

    if (args.inputPath.empty()) {
        return args;
    }

    if (args.side != "auto" && args.side != "left" && args.side != "right" && args.side != "center") {
        cerr << "[ERROR] Unknown fold side: " << args.side << endl;
        return args;
    }

    // Auto-generate output base if not provided
    if (args.outputBase.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        size_t slashPos = args.inputPath.find_last_of("/\\");
        if (dotPos == string::npos || (slashPos != string::npos && dotPos < slashPos)) {
            args.outputBase = args.inputPath + "_corrected";
        } else {
            args.outputBase = args.inputPath.substr(0, dotPos) + "_corrected";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "FolioGeom CLI - Straighten scanned pages and split book spreads at the fold\n"
         << "Using libfoliogeom v" << folio_geom_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-o <output_base>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output  Output path without extension (default: <input>_corrected)\n"
         << "                Spreads are written as <output>_left.jpg / <output>_right.jpg\n"
         << "\n"
         << "Page correction:\n"
         << "  --contour-border <px>  Margin kept around the page (default: 150)\n"
         << "  --coverage-threshold <0-1>  Leave pages covering this much of the frame untouched (default: 0.90)\n"
         << "  --dpi <value>  Scan resolution for format detection (default: unknown)\n"
         << "  --trimmed-fit  Use trimmed least squares instead of RANSAC for border lines\n"
         << "  --polygon-only  Skip the gradient border scan, use the page mask polygon only\n"
         << "  --seed <n>     Random seed for line fitting and fold sampling (default: 42)\n"
         << "\n"
         << "Fold and split:\n"
         << "  --side <auto|left|right|center>  Where the fold is (default: auto)\n"
         << "  --force-fold   Look for a fold even when the page is not an A3 spread\n"
         << "  -m, --margin <px>  Overlap kept on each side of the fold (default: 50)\n"
         << "  --smart-crop   Trim the outer page edges after splitting\n"
         << "  --no-split     Locate the fold but write a single image\n"
         << "\n"
         << "General:\n"
         << "  --quality     Print before/after quality metrics\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i scan.tif\n"
         << "  " << progName << " -i scan.tif -o out/page_001\n"
         << "  " << progName << " -i spread.tif --dpi 300            # A3 spreads are split at the fold\n"
         << "  " << progName << " -i spread.tif --force-fold --side center -m 80\n"
         << "  " << progName << " -i scan.tif --coverage-threshold 0.95 --contour-border 100\n"
         << "  " << progName << " -i scan.tif -d  # Saves debug images to ./debug/\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage, void* user_data) {
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(FolioGeomResultCode error_code, const char* error_message, void* user_data) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

int32_t sideCode(const string& side) {
    if (side == "left") return FOLIO_GEOM_SIDE_LEFT;
    if (side == "right") return FOLIO_GEOM_SIDE_RIGHT;
    if (side == "center") return FOLIO_GEOM_SIDE_CENTER;
    return FOLIO_GEOM_SIDE_AUTO;
}

const char* sideLabel(int32_t side) {
    switch (side) {
        case FOLIO_GEOM_SIDE_LEFT: return "left";
        case FOLIO_GEOM_SIDE_RIGHT: return "right";
        case FOLIO_GEOM_SIDE_CENTER: return "center";
        default: return "auto";
    }
}

const char* formatLabel(int32_t format) {
    switch (format) {
        case FOLIO_GEOM_FORMAT_A3: return "A3";
        case FOLIO_GEOM_FORMAT_A4: return "A4";
        case FOLIO_GEOM_FORMAT_A5: return "A5";
        case FOLIO_GEOM_FORMAT_LETTER: return "Letter";
        case FOLIO_GEOM_FORMAT_LEGAL: return "Legal";
        case FOLIO_GEOM_FORMAT_TABLOID: return "Tabloid";
        default: return "unknown";
    }
}

int main(int argc, char* argv[]) {
    Arguments args = parseArguments(argc, argv);

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] FolioGeom CLI v" << folio_geom_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputBase << "*.jpg" << endl;
    }

    // Validate input file
    if (!std::ifstream(args.inputPath).good()) {
        cerr << "[ERROR] Input file is not readable: " << args.inputPath << endl;
        return 1;
    }

    if (!folio_geom_is_valid_image_file(args.inputPath.c_str())) {
        cerr << "[ERROR] Input file is not a supported image: " << args.inputPath << endl;
        return 1;
    }

    // Get default parameters
    FolioGeomParams params;
    folio_geom_get_default_params(&params);

    params.contour_border = args.contourBorder;
    params.coverage_threshold = args.coverageThreshold;
    params.dpi_x = args.dpi;
    params.dpi_y = args.dpi;
    params.fold_side = sideCode(args.side);
    params.split_margin = args.splitMargin;
    params.smart_crop = args.smartCrop;
    params.force_fold = args.forceFold;
    params.split_pages = !args.noSplit;
    params.random_seed = args.seed;
    params.evaluate_quality = args.quality;

    if (args.trimmedFit) {
        params.fit_strategy = FOLIO_GEOM_FIT_TRIMMED_LEAST_SQUARES;
        cout << "[INFO] Border lines fitted with trimmed least squares" << endl;
    }

    if (args.polygonOnly) {
        params.use_gradient_method = false;
        cout << "[INFO] Gradient border scan disabled - using page mask polygon" << endl;
    }

    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to ./debug/" << endl;
    }

    // Validate parameters
    FolioGeomResultCode validation_result = folio_geom_validate_params(&params);
    if (validation_result != FOLIO_GEOM_SUCCESS) {
        cerr << "[ERROR] Invalid parameters: " << folio_geom_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Contour border: " << params.contour_border << "px" << endl;
        cout << "  Coverage threshold: " << params.coverage_threshold * 100.0 << "%" << endl;
        cout << "  DPI: " << (params.dpi_x > 0.0 ? to_string(params.dpi_x) : string("unknown")) << endl;
        cout << "  Fold side: " << sideLabel(params.fold_side) << (params.force_fold ? " (forced)" : "") << endl;
        cout << "  Split margin: " << params.split_margin << "px" << (params.smart_crop ? " with smart crop" : "") << endl;
        cout << "  Line fitting: " << (params.fit_strategy == FOLIO_GEOM_FIT_RANSAC ? "RANSAC" : "trimmed least squares")
             << ", seed " << params.random_seed << endl;
    }

    FolioGeomResult result;
    FolioGeomResultCode code = folio_geom_process_image_to_files(
        args.inputPath.c_str(),
        args.outputBase.c_str(),
        &params,
        &result,
        args.verbose ? progressCallback : nullptr,
        errorCallback,
        nullptr  // No user data needed for CLI
    );

    if (code != FOLIO_GEOM_SUCCESS) {
        cerr << "[ERROR] Processing failed: " << folio_geom_get_error_message(code) << endl;
        return 1;
    }

    if (!result.contour_found) {
        cout << "[WARN] No page contour found - original image written unchanged" << endl;
    } else if (!result.corrected) {
        cout << "[INFO] Page already well framed (" << result.coverage * 100.0 << "% coverage)" << endl;
    } else {
        cout << "[INFO] Page straightened by " << result.angle_deg << " deg, border " << result.border_used << "px" << endl;
    }

    cout << "[INFO] Format: " << formatLabel(result.page_format) << (result.landscape ? " landscape" : "") << endl;

    if (result.fold_evaluated) {
        cout << "[INFO] Fold (" << sideLabel(result.fold_side) << ") at x=" << result.fold_x
             << ", confidence " << result.fold_confidence << endl;
        if (result.needs_review) {
            cout << "[WARN] Low fold confidence - please review the split" << endl;
        }
    }

    if (args.quality) {
        cout << "[INFO] Residual skew: " << result.residual_skew_deg << " deg" << endl;
    }

    cout << "[SUCCESS] Processing completed successfully!" << endl;
    if (result.left_box.width > 0 || result.right_box.width > 0) {
        if (result.left_box.width > 0) cout << "[INFO] Output saved to: " << args.outputBase << "_left.jpg" << endl;
        if (result.right_box.width > 0) cout << "[INFO] Output saved to: " << args.outputBase << "_right.jpg" << endl;
    } else {
        cout << "[INFO] Output saved to: " << args.outputBase << ".jpg" << endl;
    }
    return 0;
}
