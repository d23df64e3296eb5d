#ifndef FOLIO_GEOM_API_H
#define FOLIO_GEOM_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define FOLIO_GEOM_VERSION_MAJOR 1
#define FOLIO_GEOM_VERSION_MINOR 0
#define FOLIO_GEOM_VERSION_PATCH 0

// Error codes
typedef enum {
    FOLIO_GEOM_SUCCESS = 0,
    FOLIO_GEOM_ERROR_INVALID_INPUT = -1,
    FOLIO_GEOM_ERROR_FILE_NOT_FOUND = -2,
    FOLIO_GEOM_ERROR_IMAGE_LOAD_FAILED = -3,
    FOLIO_GEOM_ERROR_IMAGE_TOO_SMALL = -4,
    FOLIO_GEOM_ERROR_WRITE_FAILED = -5,
    FOLIO_GEOM_ERROR_INVALID_PARAMETERS = -6,
    FOLIO_GEOM_ERROR_PROCESSING_FAILED = -7
} FolioGeomResultCode;

typedef enum {
    FOLIO_GEOM_SIDE_AUTO = 0,
    FOLIO_GEOM_SIDE_LEFT = 1,
    FOLIO_GEOM_SIDE_RIGHT = 2,
    FOLIO_GEOM_SIDE_CENTER = 3
} FolioGeomFoldSide;

typedef enum {
    FOLIO_GEOM_FIT_RANSAC = 0,
    FOLIO_GEOM_FIT_TRIMMED_LEAST_SQUARES = 1
} FolioGeomFitStrategy;

typedef enum {
    FOLIO_GEOM_CONTOUR_NONE = 0,
    FOLIO_GEOM_CONTOUR_GRADIENT = 1,
    FOLIO_GEOM_CONTOUR_POLYGON = 2
} FolioGeomContourMethod;

typedef enum {
    FOLIO_GEOM_FORMAT_A3 = 0,
    FOLIO_GEOM_FORMAT_A4 = 1,
    FOLIO_GEOM_FORMAT_A5 = 2,
    FOLIO_GEOM_FORMAT_LETTER = 3,
    FOLIO_GEOM_FORMAT_LEGAL = 4,
    FOLIO_GEOM_FORMAT_TABLOID = 5,
    FOLIO_GEOM_FORMAT_UNKNOWN = 6
} FolioGeomPageFormat;

// Processing parameters
typedef struct {
    int32_t contour_border;          // Margin kept around the page in pixels (default: 150)
    double coverage_threshold;       // Skip correction when the page covers this fraction (default: 0.90)
    int32_t max_processing_size;     // Longer side used for contour detection (default: 1080)
    int32_t min_border_threshold;    // Below this free border only rotate (default: 50)

    double dpi_x;                    // Scan resolution, 0 = unknown (default: 0)
    double dpi_y;

    int32_t fold_side;               // FolioGeomFoldSide (default: FOLIO_GEOM_SIDE_AUTO)
    bool force_fold;                 // Look for a fold on any format (default: false)
    bool split_pages;                // Split spreads at the fold (default: true)
    int32_t split_margin;            // Overlap kept on each side of the fold (default: 50)
    bool smart_crop;                 // Trim outer page edges after splitting (default: false)
    double fold_quality_threshold;   // Lower fold confidence flags the page for review (default: 0.6)

    int32_t fit_strategy;            // FolioGeomFitStrategy (default: FOLIO_GEOM_FIT_RANSAC)
    uint64_t random_seed;            // Seed for line fitting and fold sampling (default: 42)
    bool use_gradient_method;        // Gradient border lines before the polygon fallback (default: true)
    bool use_irregular_border;       // Content-following crop (default: true)

    bool evaluate_quality;           // Compute before/after quality metrics (default: false)
    bool enable_debug_output;        // Save step-by-step images (default: false)
} FolioGeomParams;

typedef struct {
    double x;
    double y;
} FolioGeomPoint;

typedef struct {
    int32_t x;
    int32_t y;
    int32_t width;
    int32_t height;
} FolioGeomRect;

// Result of processing one image; all coordinates are pixels
typedef struct {
    bool contour_found;
    bool corrected;                  // False when the original image was kept
    int32_t contour_method;          // FolioGeomContourMethod
    FolioGeomPoint corners[4];       // TL, TR, BR, BL in the original image
    double angle_deg;
    double transform[6];             // Row-major 2x3, original -> output
    double coverage;
    int32_t border_used;
    int32_t output_width;
    int32_t output_height;

    int32_t page_format;             // FolioGeomPageFormat
    bool landscape;

    bool fold_evaluated;
    int32_t fold_side;               // FolioGeomFoldSide, never AUTO once evaluated
    int32_t fold_x;                  // Output image coordinates
    double fold_confidence;
    double fold_angle_deg;
    FolioGeomPoint fold_top;         // Fold line in the original image
    FolioGeomPoint fold_bottom;
    bool needs_review;
    FolioGeomRect left_box;          // Empty when the part was not produced
    FolioGeomRect right_box;

    double residual_skew_deg;        // Only with evaluate_quality
} FolioGeomResult;

// Progress callback function type
typedef void (*FolioGeomProgressCallback)(double progress, const char* stage, void* user_data);

// Error callback function type for detailed error reporting
typedef void (*FolioGeomErrorCallback)(FolioGeomResultCode error_code, const char* error_message, void* user_data);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void folio_geom_get_default_params(FolioGeomParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return FOLIO_GEOM_SUCCESS if valid, error code otherwise
 */
FolioGeomResultCode folio_geom_validate_params(const FolioGeomParams* params);

/**
 * Straighten a scanned page and locate its fold without writing any file.
 * A page without a detectable contour is not an error: result->corrected is false.
 * @param input_path Path to input image file
 * @param params Processing parameters (defaults when NULL)
 * @param result Result structure to fill
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback for detailed error reporting
 * @param user_data Passed through to the callbacks
 * @return FOLIO_GEOM_SUCCESS if successful, error code otherwise
 */
FolioGeomResultCode folio_geom_process_image(
    const char* input_path,
    const FolioGeomParams* params,
    FolioGeomResult* result,
    FolioGeomProgressCallback progress_callback,
    FolioGeomErrorCallback error_callback,
    void* user_data
);

/**
 * Process an image and write the outputs. Split spreads are written as
 * <output_base>_left.jpg and <output_base>_right.jpg, everything else as
 * <output_base>.jpg.
 * @param input_path Path to input image file
 * @param output_base Output path without extension
 * @param params Processing parameters (defaults when NULL)
 * @param result Optional result structure to fill (may be NULL)
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback
 * @param user_data Passed through to the callbacks
 * @return FOLIO_GEOM_SUCCESS if successful, error code otherwise
 */
FolioGeomResultCode folio_geom_process_image_to_files(
    const char* input_path,
    const char* output_base,
    const FolioGeomParams* params,
    FolioGeomResult* result,
    FolioGeomProgressCallback progress_callback,
    FolioGeomErrorCallback error_callback,
    void* user_data
);

// Utility functions

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* folio_geom_get_error_message(FolioGeomResultCode error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* folio_geom_get_version(void);

/**
 * Check if input file appears to be a valid image
 */
bool folio_geom_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // FOLIO_GEOM_API_H
