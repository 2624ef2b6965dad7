#include "Correspondence.h"
#include "omp.h"
#include <exception>

double qualityRatio(double a, double b) {
  const double lo = std::min(a, b);
  const double hi = std::max(a, b);
  if (hi <= 0)
    return 1.0;
  return lo / hi;
}

CorrespondenceEngine::CorrespondenceEngine(
    const std::vector<Camera> &cams,
    const std::vector<std::vector<Target>> &target_list,
    const VolumeParam &volume, const CorrespParam &param)
    : _cams(cams), _target_list(target_list), _volume(volume), _param(param) {
  // pre-check
  const int n_cams = static_cast<int>(_cams.size());
  REQUIRE_CTX(n_cams > 0, ErrorCode::ConfigurationError,
              "CorrespondenceEngine: no camera", "n_cam = 0");
  REQUIRE_CTX(n_cams <= MAX_CAM_RTIS, ErrorCode::ConfigurationError,
              "CorrespondenceEngine: at most 4 cameras are supported",
              "n_cam = " + std::to_string(n_cams));
  REQUIRE_CTX(static_cast<int>(_target_list.size()) == n_cams,
              ErrorCode::ConfigurationError,
              "CorrespondenceEngine: cams and target_list sizes must match",
              std::to_string(n_cams) + " vs " + std::to_string(_target_list.size()));

  buildPairs();
}

void CorrespondenceEngine::buildPairs() {
  const int n_cams = static_cast<int>(_cams.size());
  _pair_map.assign(n_cams, std::vector<std::map<std::pair<int, int>, double>>(n_cams));

  for (int i = 0; i < n_cams; ++i) {
    if (!_cams[i]._is_active)
      continue;
    for (int j = i + 1; j < n_cams; ++j) {
      if (!_cams[j]._is_active)
        continue;

      const int n_i = static_cast<int>(_target_list[i].size());
      std::vector<std::map<std::pair<int, int>, double>> per_target(n_i);

      // errors inside the parallel loop are rethrown after it
      std::exception_ptr error_ptr = nullptr;
#pragma omp parallel for schedule(dynamic, 16) if (!omp_in_parallel())
      for (int a = 0; a < n_i; ++a) {
        try {
          enumeratePairCandidates(i, a, j, per_target[a]);
        } catch (...) {
#pragma omp critical(corresp_error)
          {
            if (!error_ptr)
              error_ptr = std::current_exception();
          }
        }
      }
      if (error_ptr)
        std::rethrow_exception(error_ptr);

      // merge in target order
      auto &pairs = _pair_map[i][j];
      for (auto &m : per_target)
        pairs.insert(m.begin(), m.end());
    }
  }
}

// Distance to the epipolar polyline within eps0, then the similarity gates.
// Pair score: (4 q_sumg + 2 q_n + q_nx + q_ny) * eps0 / (d + 0.05)
void CorrespondenceEngine::enumeratePairCandidates(
    int cam_i, int pnr_i, int cam_j,
    std::map<std::pair<int, int>, double> &out_pairs) const {
  const Target &ta = _target_list[cam_i][pnr_i];

  // a target without a valid line of sight pairs with nothing
  std::vector<Pt2D> curve;
  try {
    curve = _cams[cam_i].epipolarCurve(ta._pt_center, _cams[cam_j],
                                       _volume.getZMinAll(),
                                       _volume.getZMaxAll(),
                                       _param.n_epi_points);
  } catch (FatalError const &e) {
    if (e.code() != ErrorCode::ReconstructionFailure)
      throw;
    return;
  }
  if (curve.empty())
    return;

  const auto &targets_j = _target_list[cam_j];
  for (int b = 0; b < static_cast<int>(targets_j.size()); ++b) {
    const Target &tb = targets_j[b];

    const double d = myMATH::distToPolyline(tb._pt_center, curve);
    if (d > _param.eps0)
      continue;

    const double q_n = qualityRatio(ta._n, tb._n);
    const double q_nx = qualityRatio(ta._nx, tb._nx);
    const double q_ny = qualityRatio(ta._ny, tb._ny);
    const double q_sumg = qualityRatio(ta._sumg, tb._sumg);
    if (q_n < _param.cn || q_nx < _param.cnx || q_ny < _param.cny ||
        q_sumg < _param.csumg)
      continue;

    const double score =
        (4 * q_sumg + 2 * q_n + q_nx + q_ny) * _param.eps0 / (d + 0.05);
    out_pairs[{pnr_i, b}] = score;
  }
}

double CorrespondenceEngine::getPairScore(int cam_i, int pnr_i, int cam_j,
                                          int pnr_j) const {
  if (cam_i > cam_j) {
    std::swap(cam_i, cam_j);
    std::swap(pnr_i, pnr_j);
  }
  const auto &pairs = _pair_map[cam_i][cam_j];
  auto it = pairs.find({pnr_i, pnr_j});
  return it == pairs.end() ? -1.0 : it->second;
}

// Build tuples on the subset (increasing camera ids, iterative DFS).
// Root: each accepted pair of the first two cameras. Extension on the next
// camera keeps only targets paired with every chosen target.
void CorrespondenceEngine::buildTuples(
    const std::vector<int> &cam_subset,
    std::vector<Correspondence> &out_tuples) const {
  const int n_cams = static_cast<int>(_cams.size());
  const int k = static_cast<int>(cam_subset.size());
  const int c0 = cam_subset[0];
  const int c1 = cam_subset[1];

  struct Frame {
    std::vector<int> chosen_ids; // aligned with cam_subset
    double score_sum = 0;
    int n_pair = 0;
  };

  for (auto const &[ids, score] : _pair_map[c0][c1]) {
    std::vector<Frame> stack;
    Frame root;
    root.chosen_ids = {ids.first, ids.second};
    root.score_sum = score;
    root.n_pair = 1;
    stack.push_back(root);

    while (!stack.empty()) {
      Frame fr = stack.back();
      stack.pop_back();

      const int depth = static_cast<int>(fr.chosen_ids.size());
      if (depth == k) {
        Correspondence tuple;
        tuple._pnr_list.assign(n_cams, CORRES_NONE);
        for (int m = 0; m < k; ++m)
          tuple._pnr_list[cam_subset[m]] = fr.chosen_ids[m];
        tuple._n_cam_used = k;
        tuple._corr = fr.score_sum / fr.n_pair;
        out_tuples.push_back(std::move(tuple));
        continue;
      }

      // candidates on the next camera, taken from its pair list with c0
      const int cam_next = cam_subset[depth];
      const auto &pairs0 = _pair_map[c0][cam_next];
      auto it = pairs0.lower_bound({fr.chosen_ids[0], -1});
      std::vector<Frame> children;
      for (; it != pairs0.end() && it->first.first == fr.chosen_ids[0]; ++it) {
        const int cand = it->first.second;
        Frame child = fr;
        child.score_sum += it->second;
        child.n_pair += 1;

        bool is_ok = true;
        for (int m = 1; m < depth && is_ok; ++m) {
          const double s = getPairScore(cam_subset[m], fr.chosen_ids[m], cam_next, cand);
          if (s < 0) {
            is_ok = false;
          } else {
            child.score_sum += s;
            child.n_pair += 1;
          }
        }
        if (!is_ok)
          continue;

        child.chosen_ids.push_back(cand);
        children.push_back(std::move(child));
      }
      // reversed so that the stack pops them in increasing order
      for (auto rit = children.rbegin(); rit != children.rend(); ++rit)
        stack.push_back(std::move(*rit));
    }
  }
}

bool CorrespondenceEngine::checkTuple(Correspondence &tuple) const {
  if (tuple._corr < _param.corrmin)
    return false;

  std::vector<Line3D> los;
  los.reserve(tuple._n_cam_used);
  try {
    for (int c = 0; c < static_cast<int>(_cams.size()); ++c) {
      const int pnr = tuple._pnr_list[c];
      if (pnr == CORRES_NONE)
        continue;
      los.push_back(_cams[c].lineOfSight(_target_list[c][pnr]._pt_center));
    }
  } catch (FatalError const &e) {
    if (e.code() != ErrorCode::ReconstructionFailure)
      throw;
    return false;
  }

  StatusOr<TriangulationResult> res = triangulate(los);
  if (!res.ok())
    return false;

  tuple._pt3d = res.value().pt3d;
  tuple._residual = res.value().residual;
  if (tuple._residual > _param.tol_3d)
    return false;

  return _volume.isInside(tuple._pt3d);
}

// Greedy selection under target exclusivity, ordered by:
//    1) arity DESC  2) residual ASC  3) per-camera ids, lexicographic ASC
std::vector<Correspondence>
CorrespondenceEngine::pruneMatch(std::vector<Correspondence> &candidates) const {
  std::sort(candidates.begin(), candidates.end(),
            [](const Correspondence &a, const Correspondence &b) {
              if (a._n_cam_used != b._n_cam_used)
                return a._n_cam_used > b._n_cam_used;
              if (a._residual != b._residual)
                return a._residual < b._residual;
              return a._pnr_list < b._pnr_list;
            });

  const int n_cams = static_cast<int>(_cams.size());
  std::vector<std::vector<char>> is_used(n_cams);
  for (int c = 0; c < n_cams; ++c)
    is_used[c].assign(_target_list[c].size(), 0);

  std::vector<Correspondence> selected;
  for (auto &cand : candidates) {
    bool is_free = true;
    for (int c = 0; c < n_cams && is_free; ++c) {
      const int pnr = cand._pnr_list[c];
      if (pnr != CORRES_NONE && is_used[c][pnr])
        is_free = false;
    }
    if (!is_free)
      continue;

    for (int c = 0; c < n_cams; ++c) {
      const int pnr = cand._pnr_list[c];
      if (pnr != CORRES_NONE)
        is_used[c][pnr] = 1;
    }
    selected.push_back(std::move(cand));
  }
  return selected;
}

CorrespondenceResult CorrespondenceEngine::match() const {
  const int n_cams = static_cast<int>(_cams.size());

  std::vector<int> active_cams;
  for (int c = 0; c < n_cams; ++c)
    if (_cams[c]._is_active)
      active_cams.push_back(c);
  const int n_active = static_cast<int>(active_cams.size());

  // ---- Stage A + B: build tuples for every camera subset, largest first ----
  std::vector<Correspondence> tuples;
  const int k_min = _param.all_cam_flag ? n_active : 2;
  for (int k = n_active; k >= std::max(2, k_min); --k) {
    std::vector<std::vector<int>> combs;
    myMATH::generateCombinations(n_active, k, combs);
    for (auto const &comb : combs) {
      std::vector<int> cam_subset;
      for (int id : comb)
        cam_subset.push_back(active_cams[id]);
      buildTuples(cam_subset, tuples);
    }
  }

  // ---- Stage C: check (per-thread buckets, merged in input order) ----
  const int n_tuple = static_cast<int>(tuples.size());
  std::vector<char> is_valid(n_tuple, 0);
  std::exception_ptr error_ptr = nullptr;
#pragma omp parallel for schedule(dynamic, 64) if (!omp_in_parallel())
  for (int t = 0; t < n_tuple; ++t) {
    try {
      is_valid[t] = checkTuple(tuples[t]) ? 1 : 0;
    } catch (...) {
#pragma omp critical(corresp_error)
      {
        if (!error_ptr)
          error_ptr = std::current_exception();
      }
    }
  }
  if (error_ptr)
    std::rethrow_exception(error_ptr);

  std::vector<Correspondence> candidates;
  candidates.reserve(n_tuple);
  for (int t = 0; t < n_tuple; ++t)
    if (is_valid[t])
      candidates.push_back(std::move(tuples[t]));

  // ---- Stage D: prune ----
  CorrespondenceResult result;
  result._corresp_list = pruneMatch(candidates);

  result._tnr_list.resize(n_cams);
  for (int c = 0; c < n_cams; ++c)
    result._tnr_list[c].assign(_target_list[c].size(), CORRES_NONE);
  for (int p = 0; p < static_cast<int>(result._corresp_list.size()); ++p) {
    const auto &pnr_list = result._corresp_list[p]._pnr_list;
    for (int c = 0; c < n_cams; ++c)
      if (pnr_list[c] != CORRES_NONE)
        result._tnr_list[c][pnr_list[c]] = p;
  }

  return result;
}

CorrespondenceResult findCorrespondences(const std::vector<Camera> &cams,
                                         std::vector<std::vector<Target>> &target_list,
                                         const VolumeParam &volume,
                                         const CorrespParam &param) {
  CorrespondenceEngine engine(cams, target_list, volume, param);
  CorrespondenceResult result = engine.match();

  for (size_t c = 0; c < target_list.size(); ++c)
    for (size_t i = 0; i < target_list[c].size(); ++i)
      target_list[c][i]._tnr = result._tnr_list[c][i];

  return result;
}

std::vector<Point3D> makePoint3DList(const CorrespondenceResult &result) {
  std::vector<Point3D> pt3d_list;
  pt3d_list.reserve(result._corresp_list.size());
  int id = 1;
  for (auto const &corresp : result._corresp_list) {
    Point3D pt(id++, corresp._pt3d);
    for (size_t c = 0; c < corresp._pnr_list.size() && c < MAX_CAM_RTIS; ++c)
      pt._pnr_list[c] = corresp._pnr_list[c];
    pt3d_list.push_back(pt);
  }
  return pt3d_list;
}
