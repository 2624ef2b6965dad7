/**
 * Correspondence
 * Pipeline: pair (epipolar band + similarity per camera pair)
 *           -> build (tuples whose pairs are all accepted)
 *           -> check (score, triangulation residual, volume)
 *           -> prune (greedy disjoint selection).
 *
 * Notes:
 * - Cameras are visited in increasing index order and candidate tuples are
 *   sorted before pruning, so the output does not depend on thread count.
 * - At most MAX_CAM_RTIS cameras (the rt_is record has 4 slots).
 */
#pragma once
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>
#include <vector>

#include "Camera.h"
#include "Config.h"
#include "Matrix.h"
#include "PTVCommons.h"
#include "TargetInfo.h"
#include "Triangulation.h"
#include "myMATH.h"

// One accepted group of targets seen from different cameras
struct Correspondence {
  std::vector<int> _pnr_list; // size n_cam, CORRES_NONE if the camera is unused
  int _n_cam_used = 0;        // arity
  double _residual = 0;       // triangulation residual [mm]
  double _corr = 0;           // mean pair score
  Pt3D _pt3d;                 // triangulated position [mm]
};

struct CorrespondenceResult {
  std::vector<Correspondence> _corresp_list; // accepted, best first
  std::vector<std::vector<int>> _tnr_list;   // [cam][pnr] -> index in _corresp_list, or CORRES_NONE
};

class CorrespondenceEngine {
public:
  // Throws FatalError(ConfigurationError) for 0 or more than 4 cameras,
  // or when target_list and cams differ in size.
  explicit CorrespondenceEngine(const std::vector<Camera> &cams,
                                const std::vector<std::vector<Target>> &target_list,
                                const VolumeParam &volume,
                                const CorrespParam &param);

  // Main entry
  CorrespondenceResult match() const;

  // score of an accepted pair, negative if the pair is not accepted
  double getPairScore(int cam_i, int pnr_i, int cam_j, int pnr_j) const;

private:
  const std::vector<Camera> &_cams;
  const std::vector<std::vector<Target>> &_target_list;
  const VolumeParam &_volume;
  const CorrespParam &_param;

  // accepted pairs: _pair_map[i][j][(pnr_i, pnr_j)] = score, for i < j
  std::vector<std::vector<std::map<std::pair<int, int>, double>>> _pair_map;

  // ---- main pipeline pieces ----
  void buildPairs();

  // candidates on cam_j for target pnr_i of cam_i, epipolar band and similarity
  void enumeratePairCandidates(int cam_i, int pnr_i, int cam_j,
                               std::map<std::pair<int, int>, double> &out_pairs) const;

  // tuples on the camera subset, all pairs accepted
  void buildTuples(const std::vector<int> &cam_subset,
                   std::vector<Correspondence> &out_tuples) const;

  bool checkTuple(Correspondence &tuple) const;

  std::vector<Correspondence> pruneMatch(std::vector<Correspondence> &candidates) const;
};

// similarity of two values, min/max (1 when both are zero)
double qualityRatio(double a, double b);

// find_correspondences, and write the point index into each used target (_tnr)
CorrespondenceResult findCorrespondences(const std::vector<Camera> &cams,
                                         std::vector<std::vector<Target>> &target_list,
                                         const VolumeParam &volume,
                                         const CorrespParam &param);

// rt_is points: ids 1..N in acceptance order, camera slots padded with CORRES_NONE
std::vector<Point3D> makePoint3DList(const CorrespondenceResult &result);
