#ifndef SEQUENCE_H
#define SEQUENCE_H

#include <atomic>
#include <iostream>
#include <string>
#include <vector>

#include "Camera.h"
#include "Config.h"
#include "ImageIO.h"
#include "PTVCommons.h"
#include "TargetFinder.h"
#include "TargetInfo.h"

// Cooperative cancellation, checked before a frame starts
class CancelToken
{
public:
    void cancel () { _is_cancelled.store(true); };
    void reset () { _is_cancelled.store(false); };
    bool isCancelled () const { return _is_cancelled.load(); };

private:
    std::atomic<bool> _is_cancelled{false};
};

struct FrameSummary
{
    int frame = 0;
    int n_points = 0;
    std::vector<int> n_detections_per_camera;
};

struct FrameFailure
{
    int frame = 0;
    PipelineStage stage = PipelineStage::Load;
    Error error;
};

struct SequenceSummary
{
    std::vector<FrameSummary> frame_list;  // processed frames, increasing
    std::vector<FrameFailure> failed_list; // failed frames, increasing
    std::vector<int> cancelled_list;       // frames never started
    bool is_cancelled = false;

    void print (std::ostream& out = std::cout) const;
};

// Per frame: load images -> detect -> correspond -> triangulate -> persist.
// Frames are independent and run on OpenMP threads, each writes only its own files.
class Sequence
{
public:
    // Throws FatalError(ConfigurationError) when the number of cameras, calibrations
    // and image sources disagree.
    Sequence (PTVSetting const& setting, ImageSource const& img_src, std::vector<Camera> const& cams);

    // With FrameErrorPolicy::FailFast the error of the lowest failed frame is
    // rethrown (context "frame=... stage=...") once running frames are done.
    SequenceSummary run (CancelToken const* cancel = nullptr) const;

    // one frame, stage is updated as the pipeline advances
    FrameSummary processFrame (int frame, PipelineStage& stage) const;

private:
    PTVSetting const& _setting;
    ImageSource const& _img_src;
    std::vector<Camera> const& _cams;

    std::vector<std::vector<Target>> loadTargets (int frame, PipelineStage& stage) const;
};

SequenceSummary runSequence (PTVSetting const& setting, ImageSource const& img_src, 
                             std::vector<Camera> const& cams, CancelToken const* cancel = nullptr);

// split [first, last] into n_chunk consecutive ranges of (last-first+1)/n_chunk
// frames, the last range takes the remainder
struct FrameRange
{
    int first = 0;
    int last = 0;
};
std::vector<FrameRange> chunkFrameRange (int first, int last, int n_chunk);

#endif
