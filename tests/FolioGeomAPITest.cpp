#include "FolioGeomAPI.h"
#include "SyntheticImages.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace FolioGeom;
using namespace cv;
using namespace std;

namespace {

struct CallbackLog {
    vector<double> progress;
    vector<FolioGeomResultCode> errors;
};

void recordProgress(double progress, const char*, void* user_data) {
    static_cast<CallbackLog*>(user_data)->progress.push_back(progress);
}

void recordError(FolioGeomResultCode code, const char*, void* user_data) {
    static_cast<CallbackLog*>(user_data)->errors.push_back(code);
}

string skewedPageFile(const string& name) {
    return Synthetic::writeTemp(
        Synthetic::rotatedPage(Size(1000, 800), 40, 200, RotatedRect(Point2f(500, 400), Size2f(680, 520), 5.0f)), name);
}

} // namespace

TEST(FolioGeomAPITest, DefaultParamsAreValid) {
    FolioGeomParams params;
    folio_geom_get_default_params(&params);
    EXPECT_EQ(params.contour_border, 150);
    EXPECT_DOUBLE_EQ(params.coverage_threshold, 0.90);
    EXPECT_EQ(params.max_processing_size, 1080);
    EXPECT_EQ(params.fold_side, FOLIO_GEOM_SIDE_AUTO);
    EXPECT_TRUE(params.split_pages);
    EXPECT_EQ(params.split_margin, 50);
    EXPECT_EQ(params.fit_strategy, FOLIO_GEOM_FIT_RANSAC);
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_SUCCESS);
}

TEST(FolioGeomAPITest, RejectsOutOfRangeParams) {
    EXPECT_EQ(folio_geom_validate_params(nullptr), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    FolioGeomParams params;
    folio_geom_get_default_params(&params);
    params.coverage_threshold = 0.0;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    folio_geom_get_default_params(&params);
    params.max_processing_size = 100;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    folio_geom_get_default_params(&params);
    params.fold_side = 7;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    folio_geom_get_default_params(&params);
    params.split_margin = -3;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    folio_geom_get_default_params(&params);
    params.dpi_x = -300.0;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);

    folio_geom_get_default_params(&params);
    params.fit_strategy = 5;
    EXPECT_EQ(folio_geom_validate_params(&params), FOLIO_GEOM_ERROR_INVALID_PARAMETERS);
}

TEST(FolioGeomAPITest, VersionAndMessages) {
    EXPECT_STREQ(folio_geom_get_version(), "1.0.0");
    EXPECT_STREQ(folio_geom_get_error_message(FOLIO_GEOM_SUCCESS), "Success");
    EXPECT_GT(strlen(folio_geom_get_error_message(FOLIO_GEOM_ERROR_FILE_NOT_FOUND)), 0u);
    EXPECT_GT(strlen(folio_geom_get_error_message(FOLIO_GEOM_ERROR_WRITE_FAILED)), 0u);
}

TEST(FolioGeomAPITest, MissingInputs) {
    FolioGeomResult result;
    CallbackLog log;
    EXPECT_EQ(folio_geom_process_image(nullptr, nullptr, &result, nullptr, recordError, &log),
              FOLIO_GEOM_ERROR_INVALID_INPUT);
    EXPECT_EQ(folio_geom_process_image("/nonexistent/page.png", nullptr, &result, nullptr, recordError, &log),
              FOLIO_GEOM_ERROR_FILE_NOT_FOUND);
    EXPECT_EQ(folio_geom_process_image("/nonexistent/page.png", nullptr, nullptr, nullptr, nullptr, nullptr),
              FOLIO_GEOM_ERROR_INVALID_INPUT);

    ASSERT_EQ(log.errors.size(), 2u);
    EXPECT_EQ(log.errors[1], FOLIO_GEOM_ERROR_FILE_NOT_FOUND);
    EXPECT_FALSE(folio_geom_is_valid_image_file(nullptr));
}

TEST(FolioGeomAPITest, UnreadableAndTinyImages) {
    string junk = (filesystem::temp_directory_path() / "foliogeom_junk.png").string();
    {
        ofstream out(junk);
        out << "not an image";
    }
    FolioGeomResult result;
    EXPECT_EQ(folio_geom_process_image(junk.c_str(), nullptr, &result, nullptr, nullptr, nullptr),
              FOLIO_GEOM_ERROR_IMAGE_LOAD_FAILED);

    string tiny = Synthetic::writeTemp(Synthetic::uniform(Size(32, 32), 128), "foliogeom_tiny.png");
    EXPECT_EQ(folio_geom_process_image(tiny.c_str(), nullptr, &result, nullptr, nullptr, nullptr),
              FOLIO_GEOM_ERROR_IMAGE_TOO_SMALL);
}

TEST(FolioGeomAPITest, InvalidParamsAreReported) {
    string path = skewedPageFile("foliogeom_invalid_params.png");
    FolioGeomParams params;
    folio_geom_get_default_params(&params);
    params.contour_border = -1;

    FolioGeomResult result;
    CallbackLog log;
    EXPECT_EQ(folio_geom_process_image(path.c_str(), &params, &result, nullptr, recordError, &log),
              FOLIO_GEOM_ERROR_INVALID_PARAMETERS);
    ASSERT_EQ(log.errors.size(), 1u);
    EXPECT_EQ(log.errors[0], FOLIO_GEOM_ERROR_INVALID_PARAMETERS);
}

TEST(FolioGeomAPITest, ProcessesSkewedPage) {
    string path = skewedPageFile("foliogeom_skewed.png");
    EXPECT_TRUE(folio_geom_is_valid_image_file(path.c_str()));

    FolioGeomResult result;
    CallbackLog log;
    ASSERT_EQ(folio_geom_process_image(path.c_str(), nullptr, &result, recordProgress, recordError, &log),
              FOLIO_GEOM_SUCCESS);

    EXPECT_TRUE(log.errors.empty());
    ASSERT_FALSE(log.progress.empty());
    EXPECT_DOUBLE_EQ(log.progress.front(), 0.0);
    EXPECT_DOUBLE_EQ(log.progress.back(), 1.0);

    EXPECT_TRUE(result.contour_found);
    EXPECT_TRUE(result.corrected);
    EXPECT_EQ(result.contour_method, FOLIO_GEOM_CONTOUR_GRADIENT);
    EXPECT_NEAR(result.angle_deg, 5.0, 0.5);
    EXPECT_GT(result.output_width, 0);
    EXPECT_GT(result.output_height, 0);
    EXPECT_LT(result.coverage, 0.9);
    EXPECT_FALSE(result.fold_evaluated);
    EXPECT_EQ(result.left_box.width, 0);

    // Corners come back in original image coordinates
    EXPECT_GT(result.corners[0].x, 100.0);
    EXPECT_LT(result.corners[2].x, 900.0);
}

TEST(FolioGeomAPITest, BlankImageSucceedsUncorrected) {
    string path = Synthetic::writeTemp(Synthetic::uniform(Size(640, 480), 120), "foliogeom_blank.png");
    FolioGeomResult result;
    ASSERT_EQ(folio_geom_process_image(path.c_str(), nullptr, &result, nullptr, nullptr, nullptr), FOLIO_GEOM_SUCCESS);
    EXPECT_FALSE(result.contour_found);
    EXPECT_FALSE(result.corrected);
    EXPECT_EQ(result.contour_method, FOLIO_GEOM_CONTOUR_NONE);
    EXPECT_EQ(result.output_width, 640);
    EXPECT_EQ(result.output_height, 480);
    EXPECT_DOUBLE_EQ(result.transform[0], 1.0);
    EXPECT_DOUBLE_EQ(result.transform[2], 0.0);
}

TEST(FolioGeomAPITest, WritesCorrectedImage) {
    string path = skewedPageFile("foliogeom_to_files.png");
    string base = (filesystem::temp_directory_path() / "foliogeom_to_files_out").string();
    filesystem::remove(base + ".jpg");

    FolioGeomResult result;
    ASSERT_EQ(folio_geom_process_image_to_files(path.c_str(), base.c_str(), nullptr, &result, nullptr, nullptr,
                                                nullptr),
              FOLIO_GEOM_SUCCESS);
    EXPECT_TRUE(filesystem::exists(base + ".jpg"));
    EXPECT_FALSE(filesystem::exists(base + "_left.jpg"));

    EXPECT_EQ(folio_geom_process_image_to_files(path.c_str(), "", nullptr, nullptr, nullptr, nullptr, nullptr),
              FOLIO_GEOM_ERROR_INVALID_INPUT);
}
