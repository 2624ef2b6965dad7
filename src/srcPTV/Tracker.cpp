#include "Tracker.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>

#include "myMATH.h"

namespace {

struct LinkProposal {
  double cost = 0;
  double dist = 0; // to the prediction
  int id_from = 0;
  int id_to = 0;
};

bool proposalLess(LinkProposal const &a, LinkProposal const &b) {
  if (a.cost != b.cost)
    return a.cost < b.cost;
  if (a.dist != b.dist)
    return a.dist < b.dist;
  if (a.id_from != b.id_from)
    return a.id_from < b.id_from;
  return a.id_to < b.id_to;
}

// predecessor in traversal direction, fid = UNLINKED if none
void getTraversalPred(PathInfo const &path, bool is_forward, int &fid,
                      int &id) {
  if (is_forward) {
    fid = path.prev_fid;
    id = path.prev_id;
  } else {
    fid = path.next_fid;
    id = path.next_id;
  }
}

bool hasTraversalSucc(PathInfo const &path, bool is_forward) {
  return is_forward ? path.hasNext() : path.hasPrev();
}

bool hasTraversalPred(PathInfo const &path, bool is_forward) {
  return is_forward ? path.hasPrev() : path.hasNext();
}

} // namespace

// ============================== Strategies ==============================
bool TrackingStrategy::passGates(LinkCandidate const &cand,
                                 TrackParam const &param, double &angle,
                                 double &acc) {
  angle = 0;
  acc = 0;
  if (!cand.has_vel) {
    return true;
  }

  Pt3D vel_new = (cand.pt_cand - cand.pt_from) / double(cand.dt);
  angle = myMATH::angleDeg(cand.vel_old, vel_new);
  acc = myMATH::dist(vel_new, cand.vel_old);

  return angle <= param.angle && acc <= param.dacc;
}

bool GatedStrategy::evaluate(LinkCandidate const &cand,
                             TrackParam const &param, double &cost) const {
  double angle, acc;
  if (!passGates(cand, param, angle, acc)) {
    return false;
  }
  cost = angle / std::max(param.angle, SMALLNUMBER) +
         acc / std::max(param.dacc, SMALLNUMBER);
  return true;
}

bool NearestStrategy::evaluate(LinkCandidate const &cand,
                               TrackParam const &param, double &cost) const {
  double angle, acc;
  if (!passGates(cand, param, angle, acc)) {
    return false;
  }
  cost = myMATH::dist(cand.pt_pred, cand.pt_cand);
  return true;
}

TrackingStrategyRegistry::TrackingStrategyRegistry() {
  _factory_map["gated"] = []() { return std::make_unique<GatedStrategy>(); };
  _factory_map["nearest"] = []() {
    return std::make_unique<NearestStrategy>();
  };
}

TrackingStrategyRegistry &TrackingStrategyRegistry::instance() {
  static TrackingStrategyRegistry registry;
  return registry;
}

void TrackingStrategyRegistry::add(std::string const &name, Factory factory) {
  REQUIRE_CTX(!name.empty() && factory, ErrorCode::InvalidArgument,
              "TrackingStrategyRegistry::add: empty name or factory", name);
  std::lock_guard<std::mutex> lock(_mutex);
  _factory_map[name] = std::move(factory);
}

bool TrackingStrategyRegistry::contains(std::string const &name) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _factory_map.count(name) > 0;
}

std::unique_ptr<TrackingStrategy>
TrackingStrategyRegistry::create(std::string const &name) const {
  Factory factory;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _factory_map.find(name);
    if (it == _factory_map.end()) {
      THROW_FATAL_CTX(ErrorCode::ConfigurationError,
                      "TrackingStrategyRegistry: unknown tracking strategy",
                      name);
    }
    factory = it->second;
  }
  return factory();
}

std::vector<std::string> TrackingStrategyRegistry::getNames() const {
  std::lock_guard<std::mutex> lock(_mutex);
  std::vector<std::string> names;
  for (auto const &[name, factory] : _factory_map) {
    names.push_back(name);
  }
  return names;
}

// ============================== Summary ==============================
void TrackingSummary::print() const {
  std::cout << "TRACKING SUMMARY: " << n_links_made << " links, "
            << n_tracks_started << " tracks started, " << n_tracks_ended
            << " tracks ended";
  if (n_ambiguities > 0) {
    std::cout << ", " << n_ambiguities << " ambiguous links";
  }
  std::cout << std::endl;
}

TrackingSummary summarizeTracks(FrameBuffer const &fb) {
  TrackingSummary summary;
  for (int fid = 0; fid < fb.getNumFrame(); fid++) {
    for (auto const &path : fb.at(fid).path_list) {
      if (path.hasNext()) {
        summary.n_links_made++;
        if (!path.hasPrev())
          summary.n_tracks_started++;
      } else if (path.hasPrev()) {
        summary.n_tracks_ended++;
      }
    }
  }
  return summary;
}

// ============================== Tracker ==============================
Tracker::Tracker(TrackParam const &param)
    : _param(param),
      _strategy(TrackingStrategyRegistry::instance().create(param.strategy)) {
  REQUIRE_CTX(param.max_gap >= 0, ErrorCode::ConfigurationError,
              "Tracker: max_gap must not be negative",
              std::to_string(param.max_gap));
  REQUIRE(param.dvx_min <= param.dvx_max && param.dvy_min <= param.dvy_max &&
              param.dvz_min <= param.dvz_max,
          ErrorCode::ConfigurationError,
          "Tracker: velocity bounds must satisfy min <= max");
}

int Tracker::trackForward(FrameBuffer &fb) { return runPass(fb, true); }

int Tracker::trackBackward(FrameBuffer &fb) { return runPass(fb, false); }

TrackingSummary Tracker::track(FrameBuffer &fb, TrackDirection direction) {
  switch (direction) {
  case TrackDirection::Forward:
    trackForward(fb);
    break;
  case TrackDirection::Backward:
    trackBackward(fb);
    break;
  case TrackDirection::Both: {
    FrameBuffer fb_back(fb);
    trackForward(fb);
    trackBackward(fb_back);
    mergeLinks(fb, fb_back);
    break;
  }
  }

  TrackingSummary summary = summarizeTracks(fb);
  summary.n_ambiguities = _n_ambiguity;
  return summary;
}

int Tracker::mergeLinks(FrameBuffer &fb_dst, FrameBuffer const &fb_src) {
  REQUIRE(fb_dst.getNumFrame() == fb_src.getNumFrame(),
          ErrorCode::InvalidArgument,
          "Tracker::mergeLinks: frame buffers differ in length");

  int n_added = 0;
  for (int fid = 0; fid < fb_src.getNumFrame(); fid++) {
    auto const &path_list = fb_src.at(fid).path_list;
    REQUIRE_CTX(path_list.size() == fb_dst.at(fid).path_list.size(),
                ErrorCode::InvalidArgument,
                "Tracker::mergeLinks: frame buffers differ in points",
                "frame=" + std::to_string(fb_src.getFrame(fid)));
    for (int id = 0; id < int(path_list.size()); id++) {
      PathInfo const &path = path_list[id];
      if (path.hasNext() &&
          fb_dst.link(fid, id, path.next_fid, path.next_id)) {
        n_added++;
      }
    }
  }
  return n_added;
}

bool Tracker::isExtendable(FrameBuffer const &fb, int fid, int id,
                           bool is_forward) const {
  PathInfo const &path = fb.getPath(fid, id);
  if (hasTraversalSucc(path, is_forward)) {
    return false;
  }
  if (_param.add_new_particles || hasTraversalPred(path, is_forward)) {
    return true;
  }
  const int fid_seed = is_forward ? 0 : fb.getNumFrame() - 1;
  return fid == fid_seed;
}

int Tracker::runPass(FrameBuffer &fb, bool is_forward) {
  clock_t t_start, t_end;
  t_start = clock();

  const int n_frame = fb.getNumFrame();
  const int step = is_forward ? 1 : -1;
  int n_link = 0;

  // fid_to walks from the second frame of the traversal to its end
  for (int k = 1; k < n_frame; k++) {
    const int fid_to = is_forward ? k : n_frame - 1 - k;
    auto const &pt3d_list = fb.at(fid_to).pt3d_list;
    if (pt3d_list.empty()) {
      continue;
    }

    Pt3dCloud cloud_pt3d(pt3d_list);
    KDTreePt3d tree_pt3d(3, cloud_pt3d, {10 /* max leaf */});
    tree_pt3d.buildIndex();

    // direct links first, then points left behind by 1..max_gap frames
    for (int dt = 1; dt <= _param.max_gap + 1; dt++) {
      const int fid_from = fid_to - step * dt;
      if (fid_from < 0 || fid_from >= n_frame) {
        break;
      }
      n_link += linkStep(fb, tree_pt3d, fid_from, fid_to, is_forward);
    }
  }

  t_end = clock();
  std::cout << (is_forward ? "Forward" : "Backward")
            << " tracking: " << n_link << " links over " << n_frame
            << " frames; time = " << (double)(t_end - t_start) / CLOCKS_PER_SEC
            << " s" << std::endl;
  return n_link;
}

int Tracker::linkStep(FrameBuffer &fb, KDTreePt3d const &tree, int fid_from,
                      int fid_to, bool is_forward) {
  // frame numbers, not buffer positions, so the bounds stay per frame
  const int dt = std::abs(fb.getFrame(fid_to) - fb.getFrame(fid_from));
  const double sign = is_forward ? 1.0 : -1.0;
  const double r_search = _param.getRadiusMax() * dt + SQRTSMALLNUMBER;
  const double r_search2 = r_search * r_search;

  const double vel_min[3] = {_param.dvx_min, _param.dvy_min, _param.dvz_min};
  const double vel_max[3] = {_param.dvx_max, _param.dvy_max, _param.dvz_max};

  FrameData const &data_from = fb.at(fid_from);
  FrameData const &data_to = fb.at(fid_to);
  std::vector<LinkProposal> proposal_list;

  for (int id = 0; id < int(data_from.pt3d_list.size()); id++) {
    if (!isExtendable(fb, fid_from, id, is_forward)) {
      continue;
    }

    LinkCandidate cand;
    cand.pt_from = data_from.pt3d_list[id]._pt_center;
    cand.dt = dt;

    int fid_pred, id_pred;
    getTraversalPred(data_from.path_list[id], is_forward, fid_pred, id_pred);
    if (fid_pred != UNLINKED) {
      cand.has_vel = true;
      cand.vel_old = (cand.pt_from - fb.getPt(fid_pred, id_pred)) /
                     double(std::abs(fb.getFrame(fid_from) -
                                     fb.getFrame(fid_pred)));
    } else {
      cand.vel_old = Pt3D(0, 0, 0);
    }
    cand.pt_pred = cand.pt_from + cand.vel_old * double(dt);

    std::vector<nanoflann::ResultItem<size_t, double>> indices_dists;
    nanoflann::RadiusResultSet<double, size_t> result_set(r_search2,
                                                          indices_dists);
    tree.findNeighbors(result_set, cand.pt_from.data(),
                       nanoflann::SearchParameters());

    for (auto const &item : indices_dists) {
      const int id_to = int(item.first);
      if (hasTraversalPred(data_to.path_list[id_to], is_forward)) {
        continue;
      }

      cand.pt_cand = data_to.pt3d_list[id_to]._pt_center;

      // velocity of the link in forward time, per axis
      bool is_inside = true;
      for (int axis = 0; axis < 3; axis++) {
        const double vel =
            sign * (cand.pt_cand[axis] - cand.pt_from[axis]) / double(dt);
        if (vel < vel_min[axis] || vel > vel_max[axis]) {
          is_inside = false;
          break;
        }
      }
      if (!is_inside) {
        continue;
      }

      LinkProposal proposal;
      if (!_strategy->evaluate(cand, _param, proposal.cost)) {
        continue;
      }
      proposal.dist = myMATH::dist(cand.pt_pred, cand.pt_cand);
      proposal.id_from = id;
      proposal.id_to = id_to;
      proposal_list.push_back(proposal);
    }
  }

  std::sort(proposal_list.begin(), proposal_list.end(), proposalLess);

  // accepted proposal per point, for reporting ties
  std::vector<int> accept_from(data_from.pt3d_list.size(), UNLINKED);
  std::vector<int> accept_to(data_to.pt3d_list.size(), UNLINKED);

  int n_link = 0;
  for (int i = 0; i < int(proposal_list.size()); i++) {
    LinkProposal const &proposal = proposal_list[i];
    int blocker = accept_from[proposal.id_from];
    if (blocker == UNLINKED) {
      blocker = accept_to[proposal.id_to];
    }

    if (blocker == UNLINKED) {
      const bool is_linked =
          is_forward
              ? fb.link(fid_from, proposal.id_from, fid_to, proposal.id_to)
              : fb.link(fid_to, proposal.id_to, fid_from, proposal.id_from);
      if (is_linked) {
        accept_from[proposal.id_from] = i;
        accept_to[proposal.id_to] = i;
        n_link++;
      }
      continue;
    }

    LinkProposal const &winner = proposal_list[blocker];
    if (winner.cost == proposal.cost) {
      _n_ambiguity++;
      logWarning(STATUS_ERR_CTX(
          ErrorCode::LinkAmbiguity,
          "equal cost, kept the closer or lower index",
          "frame=" + std::to_string(fb.getFrame(fid_from)) + " point=" +
              std::to_string(proposal.id_from) + " -> frame=" +
              std::to_string(fb.getFrame(fid_to)) + " point=" +
              std::to_string(proposal.id_to)));
    }
  }

  return n_link;
}

// ============================== Entry point ==============================
TrackingSummary runTracking(PTVSetting const &setting,
                            TrackDirection direction) {
  Tracker tracker(setting._track_param);

  FrameBuffer fb(setting);
  switch (direction) {
  case TrackDirection::Forward:
    tracker.trackForward(fb);
    break;
  case TrackDirection::Backward:
    tracker.trackBackward(fb);
    break;
  case TrackDirection::Both: {
    FrameBuffer fb_back(setting);
    tracker.trackForward(fb);
    tracker.trackBackward(fb_back);
    int n_added = Tracker::mergeLinks(fb, fb_back);
    std::cout << "Merged " << n_added << " backward links" << std::endl;
    break;
  }
  }

  fb.writePtvis(setting);

  TrackingSummary summary = summarizeTracks(fb);
  summary.n_ambiguities = tracker.getNumAmbiguity();
  summary.print();
  return summary;
}
