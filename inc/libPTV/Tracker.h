#ifndef TRACKER_H
#define TRACKER_H

#include "nanoflann.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Config.h"
#include "FrameBuffer.h"
#include "Matrix.h"
#include "PTVCommons.h"
#include "TargetInfo.h"

// One proposed link as seen by a strategy.
// Velocities are per frame and point in the traversal direction.
struct LinkCandidate {
  Pt3D pt_from; // point being extended
  Pt3D pt_pred; // predicted position
  Pt3D pt_cand; // candidate position
  Pt3D vel_old; // valid only if has_vel
  bool has_vel = false;
  int dt = 1; // frames between pt_from and pt_cand
};

class TrackingStrategy {
public:
  virtual ~TrackingStrategy() = default;

  // return false if the candidate fails the gates, otherwise set cost
  virtual bool evaluate(LinkCandidate const &cand, TrackParam const &param,
                        double &cost) const = 0;

protected:
  // angle and acceleration gates (only when the point has a velocity)
  static bool passGates(LinkCandidate const &cand, TrackParam const &param,
                        double &angle, double &acc);
};

// cost = angle/angle_max + acc/dacc
class GatedStrategy : public TrackingStrategy {
public:
  bool evaluate(LinkCandidate const &cand, TrackParam const &param,
                double &cost) const override;
};

// cost = distance to the prediction
class NearestStrategy : public TrackingStrategy {
public:
  bool evaluate(LinkCandidate const &cand, TrackParam const &param,
                double &cost) const override;
};

class TrackingStrategyRegistry {
public:
  using Factory = std::function<std::unique_ptr<TrackingStrategy>()>;

  static TrackingStrategyRegistry &instance();

  void add(std::string const &name, Factory factory);
  bool contains(std::string const &name) const;
  // Throws FatalError(ConfigurationError) for an unknown name
  std::unique_ptr<TrackingStrategy> create(std::string const &name) const;
  std::vector<std::string> getNames() const;

private:
  TrackingStrategyRegistry();

  mutable std::mutex _mutex;
  std::map<std::string, Factory> _factory_map;
};

struct TrackingSummary {
  int n_tracks_started = 0; // points with a successor and no predecessor
  int n_tracks_ended = 0;   // points with a predecessor and no successor
  int n_links_made = 0;
  int n_ambiguities = 0; // cost ties resolved by distance or index order

  void print() const;
};

class Tracker {
public:
  explicit Tracker(TrackParam const &param);

  // links first -> last; return number of links made
  int trackForward(FrameBuffer &fb);

  // links last -> first, only points without predecessor to points without
  // successor; return number of links made
  int trackBackward(FrameBuffer &fb);

  // Both: forward on fb, backward on a copy of the untracked fb, then merge
  TrackingSummary track(FrameBuffer &fb, TrackDirection direction);

  // add links of fb_src whose ends are both free in fb_dst
  static int mergeLinks(FrameBuffer &fb_dst, FrameBuffer const &fb_src);

  int getNumAmbiguity() const { return _n_ambiguity; };

private:
  TrackParam _param;
  std::unique_ptr<TrackingStrategy> _strategy;
  int _n_ambiguity = 0;

  using KDTreePt3d = nanoflann::KDTreeSingleIndexAdaptor<
      nanoflann::L2_Simple_Adaptor<double, Pt3dCloud>, Pt3dCloud,
      3 // dimensionality
      >;

  int runPass(FrameBuffer &fb, bool is_forward);

  // propose and accept links from frame fid_from to frame fid_to
  int linkStep(FrameBuffer &fb, KDTreePt3d const &tree, int fid_from,
               int fid_to, bool is_forward);

  // can point id of frame fid start or extend a track in this pass
  bool isExtendable(FrameBuffer const &fb, int fid, int id,
                    bool is_forward) const;
};

TrackingSummary summarizeTracks(FrameBuffer const &fb);

// load rt_is of the run, track, write ptv_is
TrackingSummary runTracking(PTVSetting const &setting,
                            TrackDirection direction);

#endif
