#include "test.h"

#include <fstream>
#include <sstream>
#include <vector>

#include "Camera.h"
#include "Config.h"
#include "ImageIO.h"
#include "ResultIO.h"
#include "Sequence.h"
#include "Tracker.h"
#include "myMATH.h"
#include "scene.h"

// points of frame 1..4, moving 1 mm/frame along x
std::vector<Pt3D> getFramePoints (int frame)
{
    std::vector<Pt3D> pt_list = makeScenePoints();
    for (auto& pt : pt_list)
    {
        pt[0] += frame - 1;
    }
    return pt_list;
}

PTVSetting makeSetting (std::string const& dir)
{
    PTVSetting setting;
    setting._frame_start = 1;
    setting._frame_end = 4;
    setting._n_thread = 2;
    setting._n_cam = 2;
    setting._img_n_col = SCENE_N_PIX;
    setting._img_n_row = SCENE_N_PIX;
    setting._target_base_list = {dir + "res/cam1", dir + "res/cam2"};
    setting._volume.x_lay[0] = -50;
    setting._volume.x_lay[1] = 50;
    setting._volume.z_min_lay[0] = setting._volume.z_min_lay[1] = -30;
    setting._volume.z_max_lay[0] = setting._volume.z_max_lay[1] = 30;
    setting._corresp_param.eps0 = 1.0;
    setting._corresp_param.tol_3d = 0.5;
    setting._output_path = dir + "out/";
    setting._error_policy = FrameErrorPolicy::SkipFrame;
    return setting;
}

// rendered frames, camera 1 also sees a blob with no partner near the top edge
void addImages (MemoryImageSource& img_src, std::vector<Camera> const& cams, int frame)
{
    for (int c = 0; c < int(cams.size()); c ++)
    {
        Image img = renderImage(cams[c], getFramePoints(frame));
        if (c == 0)
        {
            drawBlob(img, Pt2D(128.3, 10.6));
        }
        img_src.addImage(c, frame, img);
    }
}

std::string readText (std::string const& path)
{
    std::ifstream fin(path);
    std::stringstream ss;
    ss << fin.rdbuf();
    return ss.str();
}

bool test_run_sequence ()
{
    std::string dir = makeResultDir("test_run_sequence");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);

    MemoryImageSource img_src(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        addImages(img_src, cams, frame);
    }

    SequenceSummary summary = runSequence(setting, img_src, cams);
    summary.print();
    CHECK(summary.frame_list.size() == 4);
    CHECK(summary.failed_list.empty());
    CHECK(!summary.is_cancelled);

    for (int frame = 1; frame <= 4; frame ++)
    {
        FrameSummary const& frame_summary = summary.frame_list[frame - 1];
        CHECK(frame_summary.frame == frame);
        CHECK(frame_summary.n_points == 4);
        CHECK(frame_summary.n_detections_per_camera == std::vector<int>({5, 4}));

        std::vector<Point3D> pt3d_list = readRtis(setting.getRtisPath(frame));
        CHECK(pt3d_list.size() == 4);
        std::vector<Pt3D> truth = getFramePoints(frame);
        for (int i = 0; i < 4; i ++)
        {
            CHECK(pt3d_list[i]._id == i + 1);
            CHECK(pt3d_list[i].getNumCamUsed() == 2);
            double d_min = 1e10;
            for (auto const& pt : truth)
            {
                d_min = std::min(d_min, myMATH::dist(pt, pt3d_list[i]._pt_center));
            }
            CHECK(d_min < 0.2);
        }

        // the unmatched blob keeps -1, every other target points at its 3D point
        std::vector<Target> target_list = readTargets(getTargetPath(setting._target_base_list[0], frame));
        CHECK(target_list.size() == 5);
        int n_unused = 0;
        for (auto const& t : target_list)
        {
            if (t._tnr == CORRES_NONE)
            {
                n_unused ++;
                CHECK(t.y() < 20);
                continue;
            }
            CHECK(t._tnr >= 0 && t._tnr < 4);
            CHECK(pt3d_list[t._tnr]._pnr_list[0] == t._pnr);
        }
        CHECK(n_unused == 1);
        CHECK(!fs::exists(setting.getRtisPath(frame) + ".tmp"));
    }
    return true;
}

// same files for any thread count
bool test_determinism ()
{
    std::vector<Camera> cams = makeCameraPair();
    MemoryImageSource img_src(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        addImages(img_src, cams, frame);
    }

    std::string dir_1 = makeResultDir("test_determinism_1");
    PTVSetting setting_1 = makeSetting(dir_1);
    setting_1._n_thread = 1;
    runSequence(setting_1, img_src, cams);

    std::string dir_4 = makeResultDir("test_determinism_4");
    PTVSetting setting_4 = makeSetting(dir_4);
    setting_4._n_thread = 4;
    runSequence(setting_4, img_src, cams);

    for (int frame = 1; frame <= 4; frame ++)
    {
        CHECK(readText(setting_1.getRtisPath(frame)) == readText(setting_4.getRtisPath(frame)));
        for (int c = 0; c < 2; c ++)
        {
            CHECK(readText(getTargetPath(setting_1._target_base_list[c], frame)) 
                  == readText(getTargetPath(setting_4._target_base_list[c], frame)));
        }
    }
    return true;
}

bool test_frame_errors ()
{
    std::string dir = makeResultDir("test_frame_errors");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);

    // camera 2 has no image at frame 3
    MemoryImageSource img_src(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        addImages(img_src, cams, frame);
    }
    MemoryImageSource img_src_gap(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        for (int c = 0; c < 2; c ++)
        {
            if (frame == 3 && c == 1) continue;
            img_src_gap.addImage(c, frame, img_src.getImage(c, frame));
        }
    }

    SequenceSummary summary = runSequence(setting, img_src_gap, cams);
    CHECK(summary.frame_list.size() == 3);
    CHECK(summary.frame_list[2].frame == 4);
    CHECK(summary.failed_list.size() == 1);
    FrameFailure const& failure = summary.failed_list[0];
    CHECK(failure.frame == 3);
    CHECK(failure.stage == PipelineStage::Load);
    CHECK(failure.error.code == ErrorCode::ImageLoadError);
    CHECK(failure.error.context.find("frame=3") != std::string::npos);
    CHECK(!fs::exists(setting.getRtisPath(3)));
    CHECK(fs::exists(setting.getRtisPath(4)));

    setting._error_policy = FrameErrorPolicy::FailFast;
    CHECK_THROW_CODE(runSequence(setting, img_src_gap, cams), ErrorCode::ImageLoadError);
    return true;
}

bool test_cancel ()
{
    std::string dir = makeResultDir("test_cancel");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);
    MemoryImageSource img_src(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        addImages(img_src, cams, frame);
    }

    CancelToken token;
    token.cancel();
    SequenceSummary summary = runSequence(setting, img_src, cams, &token);
    CHECK(summary.is_cancelled);
    CHECK(summary.frame_list.empty());
    CHECK(summary.cancelled_list == std::vector<int>({1, 2, 3, 4}));
    CHECK(!fs::exists(setting.getRtisPath(1)));

    token.reset();
    summary = runSequence(setting, img_src, cams, &token);
    CHECK(!summary.is_cancelled);
    CHECK(summary.frame_list.size() == 4);
    return true;
}

// second pass from the written target files gives the same points
bool test_existing_targets ()
{
    std::string dir = makeResultDir("test_existing_targets");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);
    MemoryImageSource img_src(2);
    for (int frame = 1; frame <= 4; frame ++)
    {
        addImages(img_src, cams, frame);
    }
    runSequence(setting, img_src, cams);
    std::vector<Point3D> pt3d_ref = readRtis(setting.getRtisPath(2));

    setting._use_existing_target = true;
    MemoryImageSource no_img(0);
    SequenceSummary summary = runSequence(setting, no_img, cams);
    CHECK(summary.frame_list.size() == 4);

    // target files keep 4 decimals
    std::vector<Point3D> pt3d_list = readRtis(setting.getRtisPath(2));
    CHECK(pt3d_list.size() == pt3d_ref.size());
    for (size_t i = 0; i < pt3d_list.size(); i ++)
    {
        CHECK(pt3d_list[i]._pnr_list == pt3d_ref[i]._pnr_list);
        CHECK_NEAR(myMATH::dist(pt3d_list[i]._pt_center, pt3d_ref[i]._pt_center), 0, 0.01);
    }
    return true;
}

bool test_setup_errors ()
{
    std::string dir = makeResultDir("test_setup_errors");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);
    MemoryImageSource img_src(2);

    std::vector<Camera> one_cam = {cams[0]};
    CHECK_THROW_CODE(runSequence(setting, img_src, one_cam), ErrorCode::ConfigurationError);

    MemoryImageSource img_src_3(3);
    CHECK_THROW_CODE(runSequence(setting, img_src_3, cams), ErrorCode::ConfigurationError);

    setting._detect_param.finder = "no_such_finder";
    CHECK_THROW_CODE(runSequence(setting, img_src, cams), ErrorCode::ConfigurationError);
    return true;
}

// one particle at 1 mm/frame along x, images rendered without any extra blob
void addSingleParticleImages (MemoryImageSource& img_src, std::vector<Camera> const& cams, 
                              int frame_hidden, int cam_hidden)
{
    for (int frame = 1; frame <= 4; frame ++)
    {
        for (int c = 0; c < int(cams.size()); c ++)
        {
            std::vector<Pt3D> pt_list;
            if (frame != frame_hidden || c != cam_hidden) pt_list.push_back(Pt3D(frame - 1, 0, 0));
            img_src.addImage(c, frame, renderImage(cams[c], pt_list));
        }
    }
}

TrackParam makeSingleParticleTrackParam ()
{
    TrackParam param;
    param.dvx_min = 0.5;
    param.dvx_max = 1.5;
    param.dvy_min = param.dvz_min = -0.5;
    param.dvy_max = param.dvz_max = 0.5;
    param.angle = 60;
    param.dacc = 1;
    param.max_gap = 1;
    return param;
}

// images -> rt_is -> ptv_is, a single track over all frames
bool test_track_single_particle ()
{
    std::string dir = makeResultDir("test_track_single_particle");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);
    setting._track_param = makeSingleParticleTrackParam();

    MemoryImageSource img_src(2);
    addSingleParticleImages(img_src, cams, 0, 0);
    SequenceSummary seq_summary = runSequence(setting, img_src, cams);
    CHECK(seq_summary.frame_list.size() == 4);
    for (auto const& frame_summary : seq_summary.frame_list)
    {
        CHECK(frame_summary.n_points == 1);
    }

    TrackingSummary summary = runTracking(setting, TrackDirection::Forward);
    CHECK(summary.n_links_made == 3);
    CHECK(summary.n_tracks_started == 1);
    CHECK(summary.n_tracks_ended == 1);

    for (int frame = 1; frame <= 4; frame ++)
    {
        std::vector<PtvisRecord> rec_list = readPtvis(setting.getPtvisPath(frame));
        CHECK(rec_list.size() == 1);
        CHECK(rec_list[0].prev == (frame == 1 ? PREV_NONE : 0));
        CHECK(rec_list[0].next == (frame == 4 ? NEXT_NONE : 0));
        CHECK_NEAR(myMATH::dist(rec_list[0].pt, Pt3D(frame - 1, 0, 0)), 0, 0.2);
    }
    return true;
}

// camera 2 misses the particle in frame 2: no point there, the track bridges it
bool test_track_over_detection_gap ()
{
    std::string dir = makeResultDir("test_track_over_detection_gap");
    std::vector<Camera> cams = makeCameraPair();
    PTVSetting setting = makeSetting(dir);
    setting._track_param = makeSingleParticleTrackParam();

    MemoryImageSource img_src(2);
    addSingleParticleImages(img_src, cams, 2, 1);
    SequenceSummary seq_summary = runSequence(setting, img_src, cams);
    CHECK(seq_summary.frame_list.size() == 4);
    CHECK(seq_summary.frame_list[1].n_points == 0);
    CHECK(seq_summary.frame_list[1].n_detections_per_camera == std::vector<int>({1, 0}));
    CHECK(readRtis(setting.getRtisPath(2)).empty());

    TrackingSummary summary = runTracking(setting, TrackDirection::Forward);
    CHECK(summary.n_links_made == 2);
    CHECK(summary.n_tracks_started == 1);
    CHECK(summary.n_tracks_ended == 1);

    std::vector<PtvisRecord> rec_1 = readPtvis(setting.getPtvisPath(1));
    std::vector<PtvisRecord> rec_2 = readPtvis(setting.getPtvisPath(2));
    std::vector<PtvisRecord> rec_3 = readPtvis(setting.getPtvisPath(3));
    std::vector<PtvisRecord> rec_4 = readPtvis(setting.getPtvisPath(4));
    CHECK(rec_1.size() == 1 && rec_2.size() == 1 && rec_3.size() == 1 && rec_4.size() == 1);
    CHECK(rec_1[0].next == 0);
    CHECK(rec_2[0].prev == 0 && rec_2[0].next == 0);
    CHECK(rec_3[0].prev == 0 && rec_3[0].next == 0);
    CHECK(rec_4[0].prev == 0 && rec_4[0].next == NEXT_NONE);

    // interpolated halfway between frames 1 and 3
    Pt3D pt_mid = (rec_1[0].pt + rec_3[0].pt) * 0.5;
    CHECK_NEAR(myMATH::dist(rec_2[0].pt, pt_mid), 0, 1e-3);
    CHECK_NEAR(myMATH::dist(rec_2[0].pt, Pt3D(1, 0, 0)), 0, 0.2);

    // without gap closing the track breaks at frame 2
    setting._track_param.max_gap = 0;
    summary = runTracking(setting, TrackDirection::Forward);
    CHECK(summary.n_links_made == 1);
    CHECK(readPtvis(setting.getPtvisPath(2)).empty());
    return true;
}

bool test_chunk_frame_range ()
{
    std::vector<FrameRange> chunk_list = chunkFrameRange(1000, 1019, 4);
    CHECK(chunk_list.size() == 4);
    for (int i = 0; i < 4; i ++)
    {
        CHECK(chunk_list[i].first == 1000 + 5 * i);
        CHECK(chunk_list[i].last == 1004 + 5 * i);
    }

    chunk_list = chunkFrameRange(1, 10, 3);
    CHECK(chunk_list.size() == 3);
    CHECK(chunk_list[2].first == 7 && chunk_list[2].last == 10);

    chunk_list = chunkFrameRange(1, 2, 5);
    CHECK(chunk_list.size() == 2);

    CHECK_THROW_CODE(chunkFrameRange(10, 1, 2), ErrorCode::InvalidArgument);
    CHECK_THROW_CODE(chunkFrameRange(1, 10, 0), ErrorCode::InvalidArgument);
    return true;
}

int main()
{
    int n_fail = 0;
    n_fail += runTest("test_run_sequence", test_run_sequence);
    n_fail += runTest("test_determinism", test_determinism);
    n_fail += runTest("test_frame_errors", test_frame_errors);
    n_fail += runTest("test_cancel", test_cancel);
    n_fail += runTest("test_existing_targets", test_existing_targets);
    n_fail += runTest("test_setup_errors", test_setup_errors);
    n_fail += runTest("test_track_single_particle", test_track_single_particle);
    n_fail += runTest("test_track_over_detection_gap", test_track_over_detection_gap);
    n_fail += runTest("test_chunk_frame_range", test_chunk_frame_range);
    return n_fail == 0 ? 0 : 1;
}
