#include "TargetFinder.h"

#include <algorithm>
#include <queue>

namespace
{

// center not smaller than any 8-neighbour; on a plateau only the first
// pixel in raster order counts
bool isLocalMax (Image const& img, int row, int col)
{
    const int rows = img.getDimRow();
    const int cols = img.getDimCol();
    const double v = img(row, col);

    for (int dr = -1; dr <= 1; ++dr)
    {
        for (int dc = -1; dc <= 1; ++dc)
        {
            if (dr == 0 && dc == 0) continue;
            const int r = row + dr;
            const int c = col + dc;
            if (r < 0 || r >= rows || c < 0 || c >= cols) continue;

            const double vn = img(r, c);
            if (vn > v) return false;
            // earlier in raster order
            if (vn == v && (dr < 0 || (dr == 0 && dc < 0))) return false;
        }
    }
    return true;
}

}


// ============================== TargetFinder2D ==============================
bool TargetFinder2D::acceptBlob (Blob const& blob, DetectParam const& param)
{
    if (blob.n < param.n_min || blob.n > param.n_max) return false;
    if (blob.nx < param.nx_min || blob.nx > param.nx_max) return false;
    if (blob.ny < param.ny_min || blob.ny > param.ny_max) return false;
    if (blob.sumg < param.sumg_min) return false;
    return true;
}

std::vector<Target> TargetFinder2D::sortBlob (std::vector<Blob>& blob_list)
{
    std::sort(blob_list.begin(), blob_list.end(), [](Blob const& a, Blob const& b) {
        if (a.y != b.y) return a.y < b.y;
        if (a.x != b.x) return a.x < b.x;
        return a.order < b.order;
    });

    std::vector<Target> target_list;
    target_list.reserve(blob_list.size());
    for (size_t i = 0; i < blob_list.size(); ++i)
    {
        Blob const& blob = blob_list[i];
        target_list.emplace_back(int(i), blob.x, blob.y, blob.n, blob.nx, blob.ny,
                                 int(std::lround(blob.sumg)), CORRES_NONE);
    }
    return target_list;
}


// ============================== ThresholdTargetFinder ==============================
std::vector<Target> 
ThresholdTargetFinder::findTarget2D (Image const& img, DetectParam const& param) const
{
    const int rows = img.getDimRow();
    const int cols = img.getDimCol();
    const double thres = param.threshold;

    // 0: free, 1: taken by a region
    std::vector<char> is_taken(size_t(rows) * cols, 0);
    std::vector<Blob> blob_list;

    const int d_row[4] = {-1, 1, 0, 0};
    const int d_col[4] = {0, 0, -1, 1};

    for (int row = 0; row < rows; ++row)
    {
        for (int col = 0; col < cols; ++col)
        {
            const double center = img(row, col);
            if (center <= thres) continue;
            if (is_taken[size_t(row) * cols + col]) continue;
            if (!isLocalMax(img, row, col)) continue;

            Blob blob;
            blob.order = int(blob_list.size());
            PixelRange range(row, col);
            double sum_x = 0, sum_y = 0;

            std::queue<std::pair<int,int>> pix_queue;
            pix_queue.push({row, col});
            is_taken[size_t(row) * cols + col] = 1;

            while (!pix_queue.empty())
            {
                auto [r, c] = pix_queue.front();
                pix_queue.pop();

                const double g = img(r, c);
                blob.n ++;
                blob.sumg += g;
                sum_x += g * c;
                sum_y += g * r;
                range.setRange(r, c);

                for (int k = 0; k < 4; ++k)
                {
                    const int rn = r + d_row[k];
                    const int cn = c + d_col[k];
                    if (rn < 0 || rn >= rows || cn < 0 || cn >= cols) continue;

                    const size_t id = size_t(rn) * cols + cn;
                    if (is_taken[id]) continue;

                    const double gn = img(rn, cn);
                    if (gn > thres && gn <= g + param.discont)
                    {
                        is_taken[id] = 1;
                        pix_queue.push({rn, cn});
                    }
                }
            }

            blob.nx = range.getNumOfCol();
            blob.ny = range.getNumOfRow();
            if (blob.sumg > 0)
            {
                blob.x = sum_x / blob.sumg;
                blob.y = sum_y / blob.sumg;
            }
            else
            {
                blob.x = col;
                blob.y = row;
            }

            if (acceptBlob(blob, param))
            {
                blob_list.push_back(blob);
            }
        }
    }

    return sortBlob(blob_list);
}


// ============================== PeakTargetFinder ==============================
std::vector<Target> 
PeakTargetFinder::findTarget2D (Image const& img, DetectParam const& param) const
{
    const int rows = img.getDimRow();
    const int cols = img.getDimCol();
    const double thres = param.threshold;

    std::vector<Blob> blob_list;

    auto safe_ln = [](double v) {
        const double vv = (v < LOGSMALLNUMBER) ? LOGSMALLNUMBER : v;
        return std::log(vv);
    };

    for (int row = 1; row < rows - 1; ++row)
    {
        for (int col = 1; col < cols - 1; ++col)
        {
            const double center = img(row, col);
            if (center <= thres) continue;
            if (!isLocalMax(img, row, col)) continue;

            const int x1 = col - 1, x2 = col, x3 = col + 1;
            const int y1 = row - 1, y2 = row, y3 = row + 1;

            // --- X direction fit ---
            const double ln_z1x = safe_ln(img(y2, x1));
            const double ln_z2  = safe_ln(center);
            const double ln_z3x = safe_ln(img(y2, x3));

            const double num_x =   ln_z1x * ((x2 * x2) - (x3 * x3))
                                 - ln_z2  * ((x1 * x1) - (x3 * x3))
                                 + ln_z3x * ((x1 * x1) - (x2 * x2));
            const double den_x =   ln_z1x * (x3 - x2)
                                 - ln_z3x * (x1 - x2)
                                 + ln_z2  * (x1 - x3);

            // --- Y direction fit ---
            const double ln_z1y = safe_ln(img(y1, x2));
            const double ln_z3y = safe_ln(img(y3, x2));

            const double num_y =   ln_z1y * ((y2 * y2) - (y3 * y3))
                                 - ln_z2  * ((y1 * y1) - (y3 * y3))
                                 + ln_z3y * ((y1 * y1) - (y2 * y2));
            const double den_y =   ln_z1y * (y3 - y2)
                                 - ln_z3y * (y1 - y2)
                                 + ln_z2  * (y1 - y3);

            // flat profile: keep the pixel position
            double xc = (std::fabs(den_x) < SMALLNUMBER) ? x2 : -0.5 * (num_x / den_x);
            double yc = (std::fabs(den_y) < SMALLNUMBER) ? y2 : -0.5 * (num_y / den_y);
            if (!std::isfinite(xc) || !std::isfinite(yc)) continue;
            if (std::fabs(xc - x2) > 1 || std::fabs(yc - y2) > 1) continue;

            Blob blob;
            blob.order = int(blob_list.size());
            blob.x = xc;
            blob.y = yc;

            PixelRange range(row, col);
            for (int r = y1; r <= y3; ++r)
            {
                for (int c = x1; c <= x3; ++c)
                {
                    const double g = img(r, c);
                    if (g <= thres) continue;
                    blob.n ++;
                    blob.sumg += g;
                    range.setRange(r, c);
                }
            }
            blob.nx = range.getNumOfCol();
            blob.ny = range.getNumOfRow();

            if (acceptBlob(blob, param))
            {
                blob_list.push_back(blob);
            }
        }
    }

    return sortBlob(blob_list);
}


// ============================== TargetFinderRegistry ==============================
TargetFinderRegistry::TargetFinderRegistry ()
{
    _factory_map["threshold"] = []() { return std::make_unique<ThresholdTargetFinder>(); };
    _factory_map["peak"] = []() { return std::make_unique<PeakTargetFinder>(); };
}

TargetFinderRegistry& TargetFinderRegistry::instance ()
{
    static TargetFinderRegistry registry;
    return registry;
}

void TargetFinderRegistry::add (std::string const& name, Factory factory)
{
    REQUIRE_CTX(!name.empty() && factory, ErrorCode::InvalidArgument,
                "TargetFinderRegistry::add: empty name or factory", name);
    std::lock_guard<std::mutex> lock(_mutex);
    _factory_map[name] = std::move(factory);
}

bool TargetFinderRegistry::contains (std::string const& name) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _factory_map.count(name) > 0;
}

std::unique_ptr<TargetFinder2D> TargetFinderRegistry::create (std::string const& name) const
{
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _factory_map.find(name);
        if (it == _factory_map.end())
        {
            THROW_FATAL_CTX(ErrorCode::ConfigurationError, "TargetFinderRegistry: unknown target finder", name);
        }
        factory = it->second;
    }
    return factory();
}

std::vector<std::string> TargetFinderRegistry::getNames () const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> names;
    for (auto const& [name, factory] : _factory_map)
    {
        names.push_back(name);
    }
    return names;
}

std::vector<Target> detectTargets (Image const& img, DetectParam const& param)
{
    return TargetFinderRegistry::instance().create(param.finder)->findTarget2D(img, param);
}
