#ifndef TARGETFINDER_H
#define TARGETFINDER_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Config.h"
#include "TargetInfo.h"
#include "Matrix.h"
#include "PTVCommons.h"

// Base class of target detectors.
// Output is sorted by y, then x, then discovery order, with _pnr = position in the list.
// Implementations must be pure (no state changes), they run concurrently.
class TargetFinder2D
{
public:
    TargetFinder2D () = default;
    virtual ~TargetFinder2D () = default;

    virtual std::vector<Target> findTarget2D (Image const& img, DetectParam const& param) const = 0;

protected:
    struct Blob
    {
        double x = 0;
        double y = 0;
        int n = 0;
        int nx = 0;
        int ny = 0;
        double sumg = 0;
        int order = 0; // discovery order
    };

    static bool acceptBlob (Blob const& blob, DetectParam const& param);
    // sort, number and convert
    static std::vector<Target> sortBlob (std::vector<Blob>& blob_list);
};

// Peak seeded region growing.
// A region starts at a local maximum above the threshold, a neighbour joins when
// it is above the threshold and at most `discont` brighter than the pixel it is
// reached from. Position is the grey value weighted centroid.
class ThresholdTargetFinder : public TargetFinder2D
{
public:
    std::vector<Target> findTarget2D (Image const& img, DetectParam const& param) const override;
};

// Local maxima refined by a 3-point log-parabola fit in x and y.
// n, nx, ny and sumg are taken from the 3x3 neighbourhood above the threshold.
class PeakTargetFinder : public TargetFinder2D
{
public:
    std::vector<Target> findTarget2D (Image const& img, DetectParam const& param) const override;
};

// Named detector variants. "threshold" and "peak" are always present.
class TargetFinderRegistry
{
public:
    using Factory = std::function<std::unique_ptr<TargetFinder2D>()>;

    static TargetFinderRegistry& instance ();

    void add (std::string const& name, Factory factory);
    bool contains (std::string const& name) const;
    // Throws FatalError(ConfigurationError) for an unknown name
    std::unique_ptr<TargetFinder2D> create (std::string const& name) const;
    std::vector<std::string> getNames () const;

private:
    TargetFinderRegistry ();

    mutable std::mutex _mutex;
    std::map<std::string, Factory> _factory_map;
};

// detect with the finder named in param
std::vector<Target> detectTargets (Image const& img, DetectParam const& param);

#endif
