#ifndef FRAMEBUFFER_H
#define FRAMEBUFFER_H

#include <string>
#include <vector>

#include "Config.h"
#include "Matrix.h"
#include "PTVCommons.h"
#include "ResultIO.h"
#include "TargetInfo.h"

// Link of one point to its neighbours in time.
// Frames are buffer positions (not frame numbers), UNLINKED when absent.
struct PathInfo
{
    int prev_fid = UNLINKED;
    int prev_id = UNLINKED;
    int next_fid = UNLINKED;
    int next_id = UNLINKED;

    bool hasPrev () const { return prev_fid != UNLINKED; };
    bool hasNext () const { return next_fid != UNLINKED; };
};

struct FrameData
{
    int frame = 0;                    // frame number
    std::vector<Point3D> pt3d_list;   // as in rt_is
    std::vector<PathInfo> path_list;  // aligned with pt3d_list
};

// 3D points of all frames of a run, with their links.
// A point has at most one predecessor and one successor, and links always
// go forward in time.
class FrameBuffer
{
public:
    FrameBuffer () {};
    // rt_is of every frame of the run, a missing file is a ConfigurationError
    explicit FrameBuffer (PTVSetting const& setting);
    // in-memory frames, consecutive
    FrameBuffer (std::vector<int> const& frame_list, std::vector<std::vector<Point3D>> const& pt3d_lists);

    int getNumFrame () const { return int(_frame_list.size()); };
    int getFrame (int fid) const;
    FrameData& at (int fid);
    FrameData const& at (int fid) const;

    Pt3D const& getPt (int fid, int id) const;
    PathInfo const& getPath (int fid, int id) const;

    // link point id_from of frame fid_from to id_to of frame fid_to (fid_from < fid_to).
    // Returns false when either end is already taken.
    bool link (int fid_from, int id_from, int fid_to, int id_to);
    int countLinks () const;

    // ptv_is records per frame; a link spanning k frames is written through
    // k-1 interpolated records appended to the skipped frames
    std::vector<std::vector<PtvisRecord>> makePtvisRecords () const;
    void writePtvis (PTVSetting const& setting) const;

private:
    std::vector<FrameData> _frame_list;
};

#endif
