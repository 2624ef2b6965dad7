#include "test.h"

#include <algorithm>
#include <map>
#include <memory>
#include <vector>

#include "Config.h"
#include "FrameBuffer.h"
#include "ResultIO.h"
#include "Tracker.h"
#include "myMATH.h"

// particle on a straight line, present in frames [first, last] (buffer positions)
struct Particle
{
    Pt3D pt0;
    Pt3D vel;
    int first = 0;
    int last = 0;
    std::vector<int> hidden; // positions where it is not seen
};

// _id of each point is the particle index, points of a frame in reverse particle order
FrameBuffer makeFrameBuffer (std::vector<Particle> const& particle_list, int n_frame)
{
    std::vector<int> frame_list;
    std::vector<std::vector<Point3D>> pt3d_lists(n_frame);
    for (int fid = 0; fid < n_frame; fid ++)
    {
        frame_list.push_back(fid + 1);
        for (int p = int(particle_list.size()) - 1; p >= 0; p --)
        {
            Particle const& particle = particle_list[p];
            if (fid < particle.first || fid > particle.last) continue;
            if (std::find(particle.hidden.begin(), particle.hidden.end(), fid) != particle.hidden.end()) continue;
            pt3d_lists[fid].emplace_back(p, particle.pt0 + particle.vel * double(fid));
        }
    }
    return FrameBuffer(frame_list, pt3d_lists);
}

TrackParam makeTrackParam ()
{
    TrackParam param;
    param.angle = 30;
    param.dacc = 0.3;
    param.max_gap = 0;
    return param;
}

// links go forward, prev/next agree, bridge at most max_gap frames,
// and only join points of the same particle
bool checkLinks (FrameBuffer const& fb, int max_gap)
{
    for (int fid = 0; fid < fb.getNumFrame(); fid ++)
    {
        auto const& data = fb.at(fid);
        for (int id = 0; id < int(data.path_list.size()); id ++)
        {
            PathInfo const& path = data.path_list[id];
            if (!path.hasNext()) continue;
            CHECK(path.next_fid > fid);
            CHECK(path.next_fid - fid <= max_gap + 1);
            PathInfo const& path_next = fb.getPath(path.next_fid, path.next_id);
            CHECK(path_next.prev_fid == fid && path_next.prev_id == id);
            CHECK(fb.at(path.next_fid).pt3d_list[path.next_id]._id == data.pt3d_list[id]._id);
        }
    }
    return true;
}

std::vector<Particle> makeParallelParticles ()
{
    std::vector<Particle> particle_list(3);
    for (int p = 0; p < 3; p ++)
    {
        particle_list[p].pt0 = Pt3D(-20 + 20 * p, 5 * p, 0);
        particle_list[p].vel = Pt3D(0.5, 0.2, 0);
        particle_list[p].first = 0;
        particle_list[p].last = 4;
    }
    return particle_list;
}

bool test_frame_buffer ()
{
    FrameBuffer fb = makeFrameBuffer(makeParallelParticles(), 3);
    CHECK(fb.getNumFrame() == 3);
    CHECK(fb.getFrame(2) == 3);
    CHECK(fb.at(1).pt3d_list.size() == 3);

    CHECK(fb.link(0, 0, 1, 0));
    CHECK(!fb.link(0, 0, 1, 1)); // start taken
    CHECK(!fb.link(0, 1, 1, 0)); // end taken
    CHECK(fb.link(0, 1, 2, 1));  // over a gap
    CHECK(fb.countLinks() == 2);
    CHECK(fb.getPath(2, 1).prev_fid == 0);
    CHECK_THROW_CODE(fb.link(2, 0, 1, 2), ErrorCode::InvalidArgument);
    CHECK_THROW_CODE(fb.at(3), ErrorCode::OutOfRange);

    std::vector<std::vector<Point3D>> pt3d_lists(2);
    CHECK_THROW_CODE(FrameBuffer({1, 2, 3}, pt3d_lists), ErrorCode::InvalidArgument);
    CHECK_THROW_CODE(FrameBuffer({2, 1}, pt3d_lists), ErrorCode::InvalidArgument);
    return true;
}

bool test_forward ()
{
    FrameBuffer fb = makeFrameBuffer(makeParallelParticles(), 5);
    Tracker tracker(makeTrackParam());
    TrackingSummary summary = tracker.track(fb, TrackDirection::Forward);
    summary.print();

    CHECK(summary.n_links_made == 12);
    CHECK(summary.n_tracks_started == 3);
    CHECK(summary.n_tracks_ended == 3);
    CHECK(summary.n_ambiguities == 0);
    CHECK(checkLinks(fb, 0));
    return true;
}

bool test_backward ()
{
    FrameBuffer fb = makeFrameBuffer(makeParallelParticles(), 5);
    Tracker tracker(makeTrackParam());
    CHECK(tracker.trackBackward(fb) == 12);
    CHECK(checkLinks(fb, 0));

    // a second pass finds nothing left to link
    CHECK(tracker.trackBackward(fb) == 0);
    CHECK(tracker.trackForward(fb) == 0);
    return true;
}

// occluded in frame 2: one link over the gap, written through an interpolated record
bool test_gap ()
{
    std::string dir = makeResultDir("test_gap");
    std::vector<Particle> particle_list = makeParallelParticles();
    particle_list[1].hidden = {1};

    TrackParam param = makeTrackParam();
    param.max_gap = 1;
    FrameBuffer fb = makeFrameBuffer(particle_list, 4);
    Tracker tracker(param);
    TrackingSummary summary = tracker.track(fb, TrackDirection::Forward);
    CHECK(summary.n_links_made == 8);
    CHECK(summary.n_tracks_started == 3);
    CHECK(checkLinks(fb, 1));

    // particle 1 is id 1 in frames 1, 3, 4 and missing in frame 2
    PathInfo const& path = fb.getPath(0, 1);
    CHECK(path.next_fid == 2 && path.next_id == 1);

    PTVSetting setting;
    setting._frame_start = 1;
    setting._frame_end = 4;
    setting._output_path = dir;
    fb.writePtvis(setting);

    std::vector<PtvisRecord> rec_1 = readPtvis(setting.getPtvisPath(1));
    std::vector<PtvisRecord> rec_2 = readPtvis(setting.getPtvisPath(2));
    std::vector<PtvisRecord> rec_3 = readPtvis(setting.getPtvisPath(3));
    CHECK(rec_1.size() == 3);
    CHECK(rec_2.size() == 3); // two seen points + one interpolated
    CHECK(rec_1[1].next == 2);
    CHECK(rec_2[2].prev == 1 && rec_2[2].next == 1);
    CHECK(rec_3[1].prev == 2);
    Pt3D pt_mid = particle_list[1].pt0 + particle_list[1].vel;
    CHECK_NEAR(myMATH::dist(rec_2[2].pt, pt_mid), 0, 1e-3);
    for (auto const& rec : rec_1)
    {
        CHECK(rec.prev == PREV_NONE);
    }

    // without gap closing the particle gives two tracks
    FrameBuffer fb_no_gap = makeFrameBuffer(particle_list, 4);
    Tracker tracker_no_gap(makeTrackParam());
    summary = tracker_no_gap.track(fb_no_gap, TrackDirection::Forward);
    CHECK(summary.n_links_made == 7);
    CHECK(summary.n_tracks_started == 3);
    CHECK(!fb_no_gap.getPath(0, 1).hasNext());
    CHECK(checkLinks(fb_no_gap, 0));
    return true;
}

// particle 3 appears in frame 3, forward tracking ignores it when new tracks are off
bool test_add_new_and_both ()
{
    std::vector<Particle> particle_list = makeParallelParticles();
    particle_list[2].first = 2;

    TrackParam param = makeTrackParam();
    param.add_new_particles = false;

    FrameBuffer fb_fwd = makeFrameBuffer(particle_list, 5);
    Tracker tracker(param);
    CHECK(tracker.trackForward(fb_fwd) == 8);

    FrameBuffer fb_back = makeFrameBuffer(particle_list, 5);
    CHECK(tracker.trackBackward(fb_back) == 10);

    CHECK(Tracker::mergeLinks(fb_fwd, fb_back) == 2);
    CHECK(checkLinks(fb_fwd, 0));

    FrameBuffer fb = makeFrameBuffer(particle_list, 5);
    TrackingSummary summary = tracker.track(fb, TrackDirection::Both);
    CHECK(summary.n_links_made == 10);
    CHECK(summary.n_tracks_started == 3);

    param.add_new_particles = true;
    FrameBuffer fb_new = makeFrameBuffer(particle_list, 5);
    Tracker tracker_new(param);
    CHECK(tracker_new.trackForward(fb_new) == 10);
    return true;
}

// bounds apply to the velocity of the link, not to the deviation from the prediction
bool test_velocity_bounds ()
{
    std::vector<Particle> particle_list(2);
    particle_list[0].pt0 = Pt3D(0, 0, 0);
    particle_list[0].vel = Pt3D(1, 0, 0);
    particle_list[0].last = 3;
    particle_list[1].pt0 = Pt3D(0, 20, 0); // slower than dvx_min
    particle_list[1].vel = Pt3D(0.2, 0, 0);
    particle_list[1].last = 3;

    TrackParam param = makeTrackParam();
    param.dvx_min = 0.5;
    param.dvx_max = 1.5;
    param.max_gap = 1;

    FrameBuffer fb = makeFrameBuffer(particle_list, 4);
    Tracker tracker(param);
    TrackingSummary summary = tracker.track(fb, TrackDirection::Forward);
    CHECK(summary.n_links_made == 3);
    CHECK(summary.n_tracks_started == 1);
    CHECK(summary.n_tracks_ended == 1);
    CHECK(checkLinks(fb, 0));

    FrameBuffer fb_back = makeFrameBuffer(particle_list, 4);
    CHECK(tracker.trackBackward(fb_back) == 3);
    CHECK(checkLinks(fb_back, 0));
    return true;
}

// frames 1, 3, 5, 7: 1.5 mm per record is 0.75 mm per frame
bool test_frame_step ()
{
    std::vector<std::vector<Point3D>> pt3d_lists(4);
    for (int fid = 0; fid < 4; fid ++)
    {
        pt3d_lists[fid].emplace_back(0, Pt3D(1.5 * fid, 0, 0));
    }
    FrameBuffer fb({1, 3, 5, 7}, pt3d_lists);

    Tracker tracker(makeTrackParam());
    TrackingSummary summary = tracker.track(fb, TrackDirection::Forward);
    CHECK(summary.n_links_made == 3);
    CHECK(summary.n_tracks_started == 1);
    CHECK(fb.getPath(2, 0).next_fid == 3);

    // the same records one frame apart are out of bounds
    FrameBuffer fb_unit({1, 2, 3, 4}, pt3d_lists);
    CHECK(tracker.trackForward(fb_unit) == 0);
    return true;
}

// two candidates at the same distance from a new point
bool test_ambiguity ()
{
    std::vector<std::vector<Point3D>> pt3d_lists(2);
    pt3d_lists[0].emplace_back(0, Pt3D(0, 0, 0));
    pt3d_lists[1].emplace_back(0, Pt3D(0.5, 0, 0));
    pt3d_lists[1].emplace_back(1, Pt3D(-0.5, 0, 0));
    FrameBuffer fb({10, 11}, pt3d_lists);

    Tracker tracker(makeTrackParam());
    TrackingSummary summary = tracker.track(fb, TrackDirection::Forward);
    CHECK(summary.n_links_made == 1);
    CHECK(summary.n_ambiguities == 1);
    CHECK(fb.getPath(0, 0).next_id == 0);

    // equal cost, settled by the distance to the prediction
    pt3d_lists[1].clear();
    pt3d_lists[1].emplace_back(0, Pt3D(0.6, 0, 0));
    pt3d_lists[1].emplace_back(1, Pt3D(0.3, 0, 0));
    FrameBuffer fb_dist({10, 11}, pt3d_lists);
    Tracker tracker_dist(makeTrackParam());
    summary = tracker_dist.track(fb_dist, TrackDirection::Forward);
    CHECK(summary.n_links_made == 1);
    CHECK(summary.n_ambiguities == 1);
    CHECK(fb_dist.getPath(0, 0).next_id == 1);
    return true;
}

// gated keeps the direction, nearest takes the point closest to the prediction
bool test_strategies ()
{
    std::vector<std::vector<Point3D>> pt3d_lists(3);
    pt3d_lists[0].emplace_back(0, Pt3D(0, 0, 0));
    pt3d_lists[1].emplace_back(0, Pt3D(0.5, 0, 0));
    pt3d_lists[2].emplace_back(0, Pt3D(1.6, 0, 0));  // straight on, 0.6 from the prediction
    pt3d_lists[2].emplace_back(1, Pt3D(1.0, 0.4, 0)); // turns, 0.4 from the prediction
    FrameBuffer fb({1, 2, 3}, pt3d_lists);

    TrackParam param = makeTrackParam();
    param.angle = 90;
    param.dacc = 1;
    param.dvx_min = -2;
    param.dvx_max = 2;
    param.strategy = "nearest";
    FrameBuffer fb_nearest = fb;
    Tracker tracker_nearest(param);
    tracker_nearest.trackForward(fb_nearest);
    CHECK(fb_nearest.getPath(1, 0).next_id == 1);

    param.strategy = "gated";
    FrameBuffer fb_gated = fb;
    Tracker tracker_gated(param);
    tracker_gated.trackForward(fb_gated);
    CHECK(fb_gated.getPath(1, 0).next_id == 0);

    TrackingStrategyRegistry& registry = TrackingStrategyRegistry::instance();
    CHECK(registry.contains("gated") && registry.contains("nearest"));
    CHECK_THROW_CODE(registry.create("no_such_strategy"), ErrorCode::ConfigurationError);

    // user strategy, accepts nothing
    class RejectStrategy : public TrackingStrategy
    {
    public:
        bool evaluate (LinkCandidate const&, TrackParam const&, double&) const override { return false; }
    };
    registry.add("reject", []() { return std::make_unique<RejectStrategy>(); });
    param.strategy = "reject";
    FrameBuffer fb_reject = fb;
    Tracker tracker_reject(param);
    CHECK(tracker_reject.trackForward(fb_reject) == 0);
    return true;
}

bool test_run_tracking ()
{
    std::string dir = makeResultDir("test_run_tracking");
    PTVSetting setting;
    setting._frame_start = 1;
    setting._frame_end = 5;
    setting._output_path = dir;
    setting._track_param = makeTrackParam();

    // rt_is frame 4 missing
    FrameBuffer fb = makeFrameBuffer(makeParallelParticles(), 5);
    for (int fid = 0; fid < 5; fid ++)
    {
        if (fid == 3) continue;
        writeRtis(setting.getRtisPath(fid + 1), fb.at(fid).pt3d_list);
    }
    CHECK_THROW_CODE(runTracking(setting, TrackDirection::Forward), ErrorCode::ConfigurationError);

    writeRtis(setting.getRtisPath(4), fb.at(3).pt3d_list);
    TrackingSummary summary = runTracking(setting, TrackDirection::Both);
    CHECK(summary.n_links_made == 12);

    for (int frame = 1; frame <= 5; frame ++)
    {
        std::vector<PtvisRecord> rec_list = readPtvis(setting.getPtvisPath(frame));
        CHECK(rec_list.size() == 3);
        for (auto const& rec : rec_list)
        {
            CHECK(frame == 1 ? rec.prev == PREV_NONE : rec.prev >= 0);
            CHECK(frame == 5 ? rec.next == NEXT_NONE : rec.next >= 0);
        }
    }

    setting._track_param.max_gap = -1;
    CHECK_THROW_CODE(runTracking(setting, TrackDirection::Forward), ErrorCode::ConfigurationError);
    setting._track_param = makeTrackParam();
    setting._track_param.strategy = "unknown";
    CHECK_THROW_CODE(runTracking(setting, TrackDirection::Forward), ErrorCode::ConfigurationError);
    return true;
}

int main()
{
    int n_fail = 0;
    n_fail += runTest("test_frame_buffer", test_frame_buffer);
    n_fail += runTest("test_forward", test_forward);
    n_fail += runTest("test_backward", test_backward);
    n_fail += runTest("test_gap", test_gap);
    n_fail += runTest("test_add_new_and_both", test_add_new_and_both);
    n_fail += runTest("test_velocity_bounds", test_velocity_bounds);
    n_fail += runTest("test_frame_step", test_frame_step);
    n_fail += runTest("test_ambiguity", test_ambiguity);
    n_fail += runTest("test_strategies", test_strategies);
    n_fail += runTest("test_run_tracking", test_run_tracking);
    return n_fail == 0 ? 0 : 1;
}
