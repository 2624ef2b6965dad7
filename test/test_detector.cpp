#include "test.h"

#include <vector>

#include "Config.h"
#include "Matrix.h"
#include "TargetFinder.h"
#include "scene.h"

DetectParam makeDetectParam ()
{
    DetectParam param;
    param.finder = "threshold";
    param.threshold = 30;
    param.n_min = 2;
    param.n_max = 100;
    param.nx_min = 1;
    param.nx_max = 20;
    param.ny_min = 1;
    param.ny_max = 20;
    param.sumg_min = 100;
    param.discont = 255;
    return param;
}

bool test_single_blob ()
{
    Image img(64, 96, 0);
    drawBlob(img, Pt2D(40.3, 20.7));

    std::vector<Target> target_list = detectTargets(img, makeDetectParam());
    CHECK(target_list.size() == 1);

    Target const& t = target_list[0];
    CHECK_NEAR(t.x(), 40.3, 0.15);
    CHECK_NEAR(t.y(), 20.7, 0.15);
    CHECK(t._pnr == 0);
    CHECK(t._tnr == CORRES_NONE);
    CHECK(t._n >= 9 && t._n <= 30);
    CHECK(t._nx >= 3 && t._nx <= 7);
    CHECK(t._ny >= 3 && t._ny <= 7);
    CHECK(t._sumg > 1000);
    return true;
}

// sorted by y, then x; pnr follows the sorted order
bool test_sort_order ()
{
    Image img(64, 128, 0);
    drawBlob(img, Pt2D(80, 50));
    drawBlob(img, Pt2D(100, 20));
    drawBlob(img, Pt2D(30, 50));

    std::vector<Target> target_list = detectTargets(img, makeDetectParam());
    CHECK(target_list.size() == 3);
    CHECK_NEAR(target_list[0].x(), 100, 1e-6);
    CHECK_NEAR(target_list[1].x(), 30, 1e-6);
    CHECK_NEAR(target_list[2].x(), 80, 1e-6);
    for (int i = 0; i < 3; i ++)
    {
        CHECK(target_list[i]._pnr == i);
    }
    return true;
}

bool test_filters ()
{
    Image img(64, 64, 0);
    drawBlob(img, Pt2D(20, 20));
    drawBlob(img, Pt2D(45, 40), 25); // below threshold

    DetectParam param = makeDetectParam();
    CHECK(detectTargets(img, param).size() == 1);

    param.n_max = 4;
    CHECK(detectTargets(img, param).empty());

    param = makeDetectParam();
    param.sumg_min = 1e5;
    CHECK(detectTargets(img, param).empty());

    param = makeDetectParam();
    param.nx_max = 2;
    CHECK(detectTargets(img, param).empty());

    // empty image
    CHECK(detectTargets(Image(32, 32, 0), makeDetectParam()).empty());
    return true;
}

// two touching spots: split when regions may not climb, one region otherwise
bool test_discontinuity ()
{
    Image img(40, 60, 0);
    drawBlob(img, Pt2D(20, 20), 200, 1.5);
    drawBlob(img, Pt2D(26, 20), 200, 1.5);

    DetectParam param = makeDetectParam();
    param.n_max = 200;
    param.discont = 0;
    std::vector<Target> target_list = detectTargets(img, param);
    CHECK(target_list.size() == 2);

    int n_total = 0;
    for (auto const& t : target_list) n_total += t._n;

    CHECK(target_list[0].x() < 23 && target_list[1].x() > 23);

    param.discont = 255;
    std::vector<Target> merged = detectTargets(img, param);
    CHECK(merged.size() == 1);
    CHECK(merged[0]._n >= n_total);
    CHECK_NEAR(merged[0].x(), 23, 0.5);
    return true;
}

bool test_peak_finder ()
{
    Image img(64, 64, 0);
    drawBlob(img, Pt2D(30.25, 22.6));

    DetectParam param = makeDetectParam();
    param.finder = "peak";
    param.n_min = 1;
    std::vector<Target> target_list = detectTargets(img, param);
    CHECK(target_list.size() == 1);
    CHECK_NEAR(target_list[0].x(), 30.25, 0.1);
    CHECK_NEAR(target_list[0].y(), 22.6, 0.1);
    return true;
}

class CenterFinder : public TargetFinder2D
{
public:
    std::vector<Target> findTarget2D (Image const& img, DetectParam const&) const override
    {
        return {Target(0, img.getDimCol() / 2.0, img.getDimRow() / 2.0, 1, 1, 1, 1)};
    }
};

bool test_registry ()
{
    TargetFinderRegistry& registry = TargetFinderRegistry::instance();
    CHECK(registry.contains("threshold"));
    CHECK(registry.contains("peak"));
    CHECK(!registry.contains("center"));

    registry.add("center", []() { return std::make_unique<CenterFinder>(); });
    DetectParam param = makeDetectParam();
    param.finder = "center";
    std::vector<Target> target_list = detectTargets(Image(10, 20, 0), param);
    CHECK(target_list.size() == 1);
    CHECK_NEAR(target_list[0].x(), 10, 0);

    param.finder = "unknown";
    CHECK_THROW_CODE(detectTargets(Image(10, 20, 0), param), ErrorCode::ConfigurationError);
    return true;
}

int main()
{
    int n_fail = 0;
    n_fail += runTest("test_single_blob", test_single_blob);
    n_fail += runTest("test_sort_order", test_sort_order);
    n_fail += runTest("test_filters", test_filters);
    n_fail += runTest("test_discontinuity", test_discontinuity);
    n_fail += runTest("test_peak_finder", test_peak_finder);
    n_fail += runTest("test_registry", test_registry);
    return n_fail == 0 ? 0 : 1;
}
