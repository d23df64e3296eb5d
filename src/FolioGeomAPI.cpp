#include "FolioGeomAPI.h"
#include "ImageIO.hpp"
#include "PageProcessor.hpp"
#include "ProcessingObserver.hpp"
#include <opencv2/core.hpp>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace FolioGeom;

// Internal helper functions
namespace {

    FoldSide toFoldSide(int32_t side) {
        switch (side) {
            case FOLIO_GEOM_SIDE_LEFT: return FoldSide::Left;
            case FOLIO_GEOM_SIDE_RIGHT: return FoldSide::Right;
            default: return FoldSide::Center;
        }
    }

    int32_t fromFoldSide(FoldSide side) {
        switch (side) {
            case FoldSide::Left: return FOLIO_GEOM_SIDE_LEFT;
            case FoldSide::Right: return FOLIO_GEOM_SIDE_RIGHT;
            default: return FOLIO_GEOM_SIDE_CENTER;
        }
    }

    int32_t fromContourMethod(ContourMethod method) {
        switch (method) {
            case ContourMethod::Gradient: return FOLIO_GEOM_CONTOUR_GRADIENT;
            case ContourMethod::Polygon: return FOLIO_GEOM_CONTOUR_POLYGON;
            default: return FOLIO_GEOM_CONTOUR_NONE;
        }
    }

    // Convert C parameters to C++ parameters
    PageProcessor::Params convertParams(const FolioGeomParams* params) {
        PageProcessor::Params cpp_params;
        cpp_params.contourBorder = params->contour_border;
        cpp_params.coverageThreshold = params->coverage_threshold;
        cpp_params.maxProcessingSize = params->max_processing_size;
        cpp_params.minBorderThreshold = params->min_border_threshold;

        cpp_params.autoDetectSide = params->fold_side == FOLIO_GEOM_SIDE_AUTO;
        cpp_params.foldSide = toFoldSide(params->fold_side);
        cpp_params.forceFold = params->force_fold;
        cpp_params.splitPages = params->split_pages;
        cpp_params.split.margin = params->split_margin;
        cpp_params.split.smartCrop = params->smart_crop;
        cpp_params.fold.qualityThreshold = params->fold_quality_threshold;

        cpp_params.fitStrategy = params->fit_strategy == FOLIO_GEOM_FIT_TRIMMED_LEAST_SQUARES
                                     ? FitStrategyKind::TrimmedLeastSquares
                                     : FitStrategyKind::Ransac;
        cpp_params.randomSeed = params->random_seed;
        cpp_params.fold.randomSeed = params->random_seed;
        cpp_params.contour.useGradientMethod = params->use_gradient_method;
        cpp_params.correction.useIrregularBorder = params->use_irregular_border;
        cpp_params.evaluateQuality = params->evaluate_quality;
        return cpp_params;
    }

    FolioGeomRect convertRect(const cv::Rect& box) {
        FolioGeomRect rect = {box.x, box.y, box.width, box.height};
        return rect;
    }

    FolioGeomPoint convertPoint(const cv::Point2d& p) {
        FolioGeomPoint point = {p.x, p.y};
        return point;
    }

    // Convert C++ page result to C result
    void convertResult(const PageResult& page, FolioGeomResult* result) {
        std::memset(result, 0, sizeof(FolioGeomResult));

        result->contour_found = page.contour.found();
        result->corrected = page.corrected;
        result->contour_method = fromContourMethod(page.method);
        for (size_t i = 0; i < page.contour.corners.size() && i < 4; i++) {
            result->corners[i] = convertPoint(page.contour.corners[i]);
        }
        result->angle_deg = page.contour.angleDeg;
        for (int r = 0; r < 2; r++) {
            for (int c = 0; c < 3; c++) {
                result->transform[r * 3 + c] = page.transform.at<double>(r, c);
            }
        }
        result->coverage = page.coverage;
        result->border_used = page.borderUsed;
        result->output_width = page.image.cols;
        result->output_height = page.image.rows;

        result->page_format = static_cast<int32_t>(page.format.format);
        result->landscape = page.format.orientation == Orientation::Landscape;

        result->fold_evaluated = page.foldEvaluated;
        if (page.foldEvaluated) {
            result->fold_side = fromFoldSide(page.foldSide);
            result->fold_x = page.fold.x;
            result->fold_confidence = page.fold.confidence;
            result->fold_angle_deg = page.fold.angleDeg;
            result->fold_top = convertPoint(page.foldTop);
            result->fold_bottom = convertPoint(page.foldBottom);
        }
        result->needs_review = page.needsReview;
        result->left_box = convertRect(page.split.leftBox);
        result->right_box = convertRect(page.split.rightBox);
        result->residual_skew_deg = page.quality.residualSkewDeg;
    }

    // Convert C++ exception to error code
    FolioGeomResultCode handleException(const std::exception& e, FolioGeomErrorCallback error_callback,
                                        void* user_data) {
        FolioGeomResultCode code = FOLIO_GEOM_ERROR_PROCESSING_FAILED;

        std::string what = e.what();
        if (what.find("Failed to load image") != std::string::npos) {
            code = FOLIO_GEOM_ERROR_IMAGE_LOAD_FAILED;
        } else if (what.find("too small") != std::string::npos) {
            code = FOLIO_GEOM_ERROR_IMAGE_TOO_SMALL;
        }

        if (error_callback) {
            error_callback(code, e.what(), user_data);
        }
        return code;
    }

    // Progress reporting helper
    void reportProgress(FolioGeomProgressCallback callback, double progress, const char* stage, void* user_data) {
        if (callback) {
            callback(progress, stage, user_data);
        }
    }

    FolioGeomResultCode checkInputs(const char* input_path, const FolioGeomParams*& params,
                                    FolioGeomParams& default_params, FolioGeomErrorCallback error_callback,
                                    void* user_data) {
        if (!input_path) {
            if (error_callback) {
                error_callback(FOLIO_GEOM_ERROR_INVALID_INPUT, "Invalid input parameters", user_data);
            }
            return FOLIO_GEOM_ERROR_INVALID_INPUT;
        }

        // Check file exists
        std::ifstream file(input_path);
        if (!file.good()) {
            if (error_callback) {
                error_callback(FOLIO_GEOM_ERROR_FILE_NOT_FOUND, "Input file not found or not readable", user_data);
            }
            return FOLIO_GEOM_ERROR_FILE_NOT_FOUND;
        }

        if (!params) {
            folio_geom_get_default_params(&default_params);
            params = &default_params;
        }

        FolioGeomResultCode validation_result = folio_geom_validate_params(params);
        if (validation_result != FOLIO_GEOM_SUCCESS && error_callback) {
            error_callback(validation_result, "Invalid processing parameters", user_data);
        }
        return validation_result;
    }

    PageResult runPipeline(const char* input_path, const FolioGeomParams* params,
                           FolioGeomProgressCallback progress_callback, void* user_data) {
        reportProgress(progress_callback, 0.0, "Loading image", user_data);
        LoadedImage input = ImageIO::loadImage(input_path, params->dpi_x, params->dpi_y);

        std::unique_ptr<DebugImageStack> debug;
        if (params->enable_debug_output) {
            debug = std::make_unique<DebugImageStack>("./debug/");
        }

        reportProgress(progress_callback, 0.2, "Detecting page contour", user_data);
        PageProcessor processor(convertParams(params), debug.get());
        PageResult page = processor.process(input);

        if (debug) {
            reportProgress(progress_callback, 0.9, "Writing debug images", user_data);
            debug->flush();
        }
        return page;
    }
}

// API Implementation

void folio_geom_get_default_params(FolioGeomParams* params) {
    if (!params) return;

    params->contour_border = 150;
    params->coverage_threshold = 0.90;
    params->max_processing_size = 1080;
    params->min_border_threshold = 50;

    params->dpi_x = 0.0;
    params->dpi_y = 0.0;

    params->fold_side = FOLIO_GEOM_SIDE_AUTO;
    params->force_fold = false;
    params->split_pages = true;
    params->split_margin = 50;
    params->smart_crop = false;
    params->fold_quality_threshold = 0.6;

    params->fit_strategy = FOLIO_GEOM_FIT_RANSAC;
    params->random_seed = 42;
    params->use_gradient_method = true;
    params->use_irregular_border = true;

    params->evaluate_quality = false;
    params->enable_debug_output = false;
}

FolioGeomResultCode folio_geom_validate_params(const FolioGeomParams* params) {
    if (!params) return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;

    // Page framing
    if (params->contour_border < 0 || params->contour_border > 2000) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    if (params->coverage_threshold <= 0.0 || params->coverage_threshold > 1.0) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    if (params->max_processing_size < 256 || params->max_processing_size > 10000) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    if (params->min_border_threshold < 0 || params->min_border_threshold > 1000) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    // Resolution
    if (params->dpi_x < 0.0 || params->dpi_x > 10000.0 || params->dpi_y < 0.0 || params->dpi_y > 10000.0) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    // Fold and split
    if (params->fold_side < FOLIO_GEOM_SIDE_AUTO || params->fold_side > FOLIO_GEOM_SIDE_CENTER) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    if (params->split_margin < 0 || params->split_margin > 2000) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    if (params->fold_quality_threshold < 0.0 || params->fold_quality_threshold > 1.0) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    // Line fitting
    if (params->fit_strategy != FOLIO_GEOM_FIT_RANSAC && params->fit_strategy != FOLIO_GEOM_FIT_TRIMMED_LEAST_SQUARES) {
        return FOLIO_GEOM_ERROR_INVALID_PARAMETERS;
    }

    return FOLIO_GEOM_SUCCESS;
}

FolioGeomResultCode folio_geom_process_image(
    const char* input_path,
    const FolioGeomParams* params,
    FolioGeomResult* result,
    FolioGeomProgressCallback progress_callback,
    FolioGeomErrorCallback error_callback,
    void* user_data
) {
    if (!result) {
        if (error_callback) {
            error_callback(FOLIO_GEOM_ERROR_INVALID_INPUT, "Invalid input parameters", user_data);
        }
        return FOLIO_GEOM_ERROR_INVALID_INPUT;
    }
    std::memset(result, 0, sizeof(FolioGeomResult));

    FolioGeomParams default_params;
    FolioGeomResultCode check = checkInputs(input_path, params, default_params, error_callback, user_data);
    if (check != FOLIO_GEOM_SUCCESS) {
        return check;
    }

    try {
        PageResult page = runPipeline(input_path, params, progress_callback, user_data);
        convertResult(page, result);
        reportProgress(progress_callback, 1.0, "Processing complete", user_data);
        return FOLIO_GEOM_SUCCESS;

    } catch (const std::exception& e) {
        return handleException(e, error_callback, user_data);
    }
}

FolioGeomResultCode folio_geom_process_image_to_files(
    const char* input_path,
    const char* output_base,
    const FolioGeomParams* params,
    FolioGeomResult* result,
    FolioGeomProgressCallback progress_callback,
    FolioGeomErrorCallback error_callback,
    void* user_data
) {
    if (!output_base || std::strlen(output_base) == 0) {
        if (error_callback) {
            error_callback(FOLIO_GEOM_ERROR_INVALID_INPUT, "Invalid output path", user_data);
        }
        return FOLIO_GEOM_ERROR_INVALID_INPUT;
    }

    FolioGeomParams default_params;
    FolioGeomResultCode check = checkInputs(input_path, params, default_params, error_callback, user_data);
    if (check != FOLIO_GEOM_SUCCESS) {
        return check;
    }

    try {
        PageResult page = runPipeline(input_path, params, progress_callback, user_data);
        if (result) {
            convertResult(page, result);
        }

        reportProgress(progress_callback, 0.95, "Writing output images", user_data);
        const std::string base(output_base);
        bool written = true;
        if (page.split.hasLeft() || page.split.hasRight()) {
            if (page.split.hasLeft()) {
                written = ImageIO::saveImage(base + "_left.jpg", page.split.left) && written;
            }
            if (page.split.hasRight()) {
                written = ImageIO::saveImage(base + "_right.jpg", page.split.right) && written;
            }
        } else {
            written = ImageIO::saveImage(base + ".jpg", page.image);
        }

        if (!written) {
            if (error_callback) {
                error_callback(FOLIO_GEOM_ERROR_WRITE_FAILED, "Failed to write output image", user_data);
            }
            return FOLIO_GEOM_ERROR_WRITE_FAILED;
        }

        reportProgress(progress_callback, 1.0, "Processing complete", user_data);
        return FOLIO_GEOM_SUCCESS;

    } catch (const std::exception& e) {
        return handleException(e, error_callback, user_data);
    }
}

const char* folio_geom_get_error_message(FolioGeomResultCode error_code) {
    switch (error_code) {
        case FOLIO_GEOM_SUCCESS: return "Success";
        case FOLIO_GEOM_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case FOLIO_GEOM_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case FOLIO_GEOM_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case FOLIO_GEOM_ERROR_IMAGE_TOO_SMALL: return "Image too small - minimum 64x64 pixels required";
        case FOLIO_GEOM_ERROR_WRITE_FAILED: return "Failed to write output image - check output path permissions";
        case FOLIO_GEOM_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case FOLIO_GEOM_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* folio_geom_get_version(void) {
    return "1.0.0";
}

bool folio_geom_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;
    return ImageIO::isReadableImage(file_path);
}
