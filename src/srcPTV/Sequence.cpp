#include "Sequence.h"
#include "Correspondence.h"
#include "ResultIO.h"

#include <ctime>
#include <exception>
#include <filesystem>
#include <optional>
#include <omp.h>

namespace
{

std::string frameContext (int frame, PipelineStage stage)
{
    return "frame=" + std::to_string(frame) + " stage=" + stageName(stage);
}

}


void SequenceSummary::print (std::ostream& out) const
{
    out << "Sequence summary:" << std::endl;
    out << "\tProcessed frames: " << frame_list.size() << std::endl;
    for (auto const& fs : frame_list)
    {
        out << "\t\tframe " << fs.frame << ": " << fs.n_points << " points, targets per camera:";
        for (int n : fs.n_detections_per_camera)
        {
            out << " " << n;
        }
        out << std::endl;
    }
    out << "\tFailed frames: " << failed_list.size() << std::endl;
    for (auto const& ff : failed_list)
    {
        out << "\t\tframe " << ff.frame << " (" << stageName(ff.stage) << "): " << ff.error.message << std::endl;
    }
    if (is_cancelled)
    {
        out << "\tCancelled, frames not started: " << cancelled_list.size() << std::endl;
    }
}


Sequence::Sequence (PTVSetting const& setting, ImageSource const& img_src, std::vector<Camera> const& cams)
    : _setting(setting), _img_src(img_src), _cams(cams)
{
    REQUIRE_CTX(int(_cams.size()) == _setting._n_cam, ErrorCode::ConfigurationError,
                "Sequence: number of calibrations != number of cameras",
                std::to_string(_cams.size()) + " vs " + std::to_string(_setting._n_cam));
    REQUIRE_CTX(int(_setting._target_base_list.size()) == _setting._n_cam, ErrorCode::ConfigurationError,
                "Sequence: number of target bases != number of cameras",
                std::to_string(_setting._target_base_list.size()) + " vs " + std::to_string(_setting._n_cam));
    if (!_setting._use_existing_target)
    {
        REQUIRE_CTX(_img_src.getNumCam() == _setting._n_cam, ErrorCode::ConfigurationError,
                    "Sequence: number of image sources != number of cameras",
                    std::to_string(_img_src.getNumCam()) + " vs " + std::to_string(_setting._n_cam));
        // fails early on an unknown detector name
        REQUIRE_CTX(TargetFinderRegistry::instance().contains(_setting._detect_param.finder), 
                    ErrorCode::ConfigurationError, "Sequence: unknown target finder", 
                    _setting._detect_param.finder);
    }
}

std::vector<std::vector<Target>> Sequence::loadTargets (int frame, PipelineStage& stage) const
{
    const int n_cam = _setting._n_cam;
    std::vector<std::vector<Target>> target_list(n_cam);

    stage = PipelineStage::Load;
    if (_setting._use_existing_target)
    {
        for (int i = 0; i < n_cam; i ++)
        {
            target_list[i] = readTargets(getTargetPath(_setting._target_base_list[i], frame));
            for (auto& t : target_list[i])
            {
                t._tnr = CORRES_NONE;
            }
        }
        return target_list;
    }

    std::vector<Image> img_list;
    img_list.reserve(n_cam);
    for (int i = 0; i < n_cam; i ++)
    {
        img_list.push_back(_img_src.getImage(i, frame));
    }

    stage = PipelineStage::Detect;
    std::unique_ptr<TargetFinder2D> finder = TargetFinderRegistry::instance().create(_setting._detect_param.finder);

    // errors inside the parallel loop are rethrown after it
    std::exception_ptr error_ptr = nullptr;
    #pragma omp parallel for if (!omp_in_parallel())
    for (int i = 0; i < n_cam; i ++)
    {
        try {
            target_list[i] = finder->findTarget2D(img_list[i], _setting._detect_param);
        } catch (...) {
            #pragma omp critical(detect_error)
            {
                if (!error_ptr) error_ptr = std::current_exception();
            }
        }
    }
    if (error_ptr)
    {
        std::rethrow_exception(error_ptr);
    }

    return target_list;
}

FrameSummary Sequence::processFrame (int frame, PipelineStage& stage) const
{
    std::vector<std::vector<Target>> target_list = loadTargets(frame, stage);

    stage = PipelineStage::Correspond;
    CorrespondenceEngine engine(_cams, target_list, _setting._volume, _setting._corresp_param);
    CorrespondenceResult result = engine.match();
    for (size_t c = 0; c < target_list.size(); c ++)
    {
        for (size_t i = 0; i < target_list[c].size(); i ++)
        {
            target_list[c][i]._tnr = result._tnr_list[c][i];
        }
    }

    stage = PipelineStage::Triangulate;
    std::vector<Point3D> pt3d_list = makePoint3DList(result);
    for (size_t i = 0; i < pt3d_list.size(); i ++)
    {
        REQUIRE_CTX(pt3d_list[i]._id == int(i) + 1, ErrorCode::Unknown,
                    "Sequence: point ids are not contiguous", frameContext(frame, stage));
    }

    stage = PipelineStage::Persist;
    for (int c = 0; c < _setting._n_cam; c ++)
    {
        writeTargets(getTargetPath(_setting._target_base_list[c], frame), target_list[c]);
    }
    writeRtis(_setting.getRtisPath(frame), pt3d_list);

    FrameSummary summary;
    summary.frame = frame;
    summary.n_points = int(pt3d_list.size());
    for (auto const& targets : target_list)
    {
        summary.n_detections_per_camera.push_back(int(targets.size()));
    }
    return summary;
}

SequenceSummary Sequence::run (CancelToken const* cancel) const
{
    const std::vector<int> frame_list = _setting.getFrameList();
    const int n_frame = int(frame_list.size());
    const int n_thread = _setting._n_thread > 0 ? _setting._n_thread : omp_get_max_threads();

    std::vector<std::optional<FrameSummary>> summary_list(n_frame);
    std::vector<std::optional<FrameFailure>> failure_list(n_frame);
    std::vector<char> is_not_started(n_frame, 0);
    std::atomic<bool> is_abort{false};

    if (!_setting._output_path.empty())
    {
        std::filesystem::create_directories(_setting._output_path);
    }
    for (auto const& base : _setting._target_base_list)
    {
        std::filesystem::path folder = std::filesystem::path(getTargetPath(base, _setting._frame_start)).parent_path();
        if (!folder.empty()) std::filesystem::create_directories(folder);
    }

    clock_t t_start = clock();
    std::cout << "Sequence: frames " << _setting._frame_start << " to " << _setting._frame_end
              << ", " << _setting._n_cam << " cameras" << std::endl;

    #pragma omp parallel for schedule(dynamic, 1) num_threads(n_thread) if (!omp_in_parallel())
    for (int i = 0; i < n_frame; i ++)
    {
        const int frame = frame_list[i];
        if (is_abort.load() || (cancel != nullptr && cancel->isCancelled()))
        {
            is_not_started[i] = 1;
            continue;
        }

        PipelineStage stage = PipelineStage::Load;
        try {
            summary_list[i] = processFrame(frame, stage);

            #pragma omp critical(sequence_log)
            {
                std::cout << "\tframe " << frame << ": " << summary_list[i]->n_points << " points" << std::endl;
            }
        } catch (FatalError const& e) {
            Error err = e.info();
            err.context = frameContext(frame, stage) + (err.context.empty() ? "" : ", " + err.context);
            failure_list[i] = FrameFailure{frame, stage, err};
        } catch (std::exception const& e) {
            failure_list[i] = FrameFailure{frame, stage, Error{ErrorCode::Unknown, e.what(), SRC_HERE, frameContext(frame, stage)}};
        }

        if (failure_list[i])
        {
            #pragma omp critical(sequence_log)
            {
                std::cerr << "\tframe " << frame << " failed: " << failure_list[i]->error.toString() << std::endl;
            }
            if (_setting._error_policy == FrameErrorPolicy::FailFast)
            {
                is_abort.store(true);
            }
        }
    }

    SequenceSummary summary;
    for (int i = 0; i < n_frame; i ++)
    {
        if (summary_list[i]) summary.frame_list.push_back(*summary_list[i]);
        if (failure_list[i]) summary.failed_list.push_back(*failure_list[i]);
        if (is_not_started[i]) summary.cancelled_list.push_back(frame_list[i]);
    }
    summary.is_cancelled = cancel != nullptr && cancel->isCancelled() && !summary.cancelled_list.empty();

    clock_t t_end = clock();
    std::cout << "Sequence done: " << summary.frame_list.size() << " frames processed, "
              << summary.failed_list.size() << " failed, time: "
              << (double) (t_end - t_start) / CLOCKS_PER_SEC << " s" << std::endl;

    if (_setting._error_policy == FrameErrorPolicy::FailFast && !summary.failed_list.empty())
    {
        throw FatalError(summary.failed_list.front().error);
    }

    return summary;
}

SequenceSummary runSequence (PTVSetting const& setting, ImageSource const& img_src, 
                             std::vector<Camera> const& cams, CancelToken const* cancel)
{
    Sequence sequence(setting, img_src, cams);
    return sequence.run(cancel);
}

std::vector<FrameRange> chunkFrameRange (int first, int last, int n_chunk)
{
    REQUIRE_CTX(last >= first, ErrorCode::InvalidArgument, "chunkFrameRange: invalid frame range",
                std::to_string(first) + "," + std::to_string(last));
    REQUIRE_CTX(n_chunk > 0, ErrorCode::InvalidArgument, "chunkFrameRange: number of chunks must be positive",
                std::to_string(n_chunk));

    const int n_total = last - first + 1;
    n_chunk = std::min(n_chunk, n_total);
    const int size = n_total / n_chunk;

    std::vector<FrameRange> chunk_list;
    chunk_list.reserve(n_chunk);
    for (int i = 0; i < n_chunk; i ++)
    {
        FrameRange range;
        range.first = first + i * size;
        range.last = (i == n_chunk - 1) ? last : range.first + size - 1;
        chunk_list.push_back(range);
    }
    return chunk_list;
}
