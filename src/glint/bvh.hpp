#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <vector>

#include "common.hpp"
#include "format.hpp"
#include "geometry.hpp"


namespace glint {

using std::vector;


struct BvhNode {
  bbox3 bbox;  // 4bytes (float) * 3 * 2 = 24 bytes

  // this index refers to
  // - Bvh::primitives when `isLeaf`
  // - Bvh::nodes      when NOT `isLeaf` (children at `begin` and `begin + 1`)
  uint32_t begin = 0;

  // number of primitives of a leaf (0 only for the leaf of an empty hierarchy)
  uint8_t num_primitives = 0;

  // 0: x, 1: y, 2: z  (used only when NOT `isLeaf`)
  uint8_t axis = 0;

  uint8_t leaf = 0;

  bool isLeaf() const { return leaf != 0; }
};
static_assert(sizeof(BvhNode) == 32, "Expect BvhNode is exactly 32 bytes");


enum class SplitPolicy {
  kMiddle,  // middle of the centroid bbox, index median when that leaves a side empty
  kSah,     // binned surface area heuristic
};

struct BvhOptions {
  uint8_t max_primitive = 2;
  SplitPolicy split = SplitPolicy::kMiddle;

  // Ranges with at least this many primitives build their left subtree on another thread
  uint32_t parallel_threshold = 4096;
  uint32_t max_spawn_depth = 4;
};


struct Bvh {
  vector<uint32_t> primitives;
  vector<BvhNode> nodes;
  BvhOptions options;
  uint32_t depth = 0;
  uint32_t num_leaves = 0;

  //
  // Some relations
  //
  // - "primitives" is a permutation of [0, #prims)
  // - each leaf node has at most "max_primitive" and at least one primitive
  //     #leafs <= #prims
  // - "nodes" is a full binary tree
  //     #nodes  =  2 * #leafs - 1  <=  2 * #prims - 1
  //
  // Construction reserves the upper bound up front so that parallel subtree builds write into
  // disjoint slices of `nodes`. A subtree with n primitives owns exactly (2n - 2) slots for its
  // descendants; `compact` then renumbers the used slots breadth first.
  //

  static Bvh create(const vector<bbox3>& bboxes, const BvhOptions& options = {});

  static void splitPrimitives(
      uint32_t begin, uint32_t end, const vector<fvec3>& centers,
      SplitPolicy policy, const vector<bbox3>& bboxes,
      /*inout*/ vector<uint32_t>& primitives,
      /*out*/ uint8_t& axis, uint32_t& middle);

  const bbox3& bbox() const { return nodes[0].bbox; }

  //
  // Nearest hit within [ray_tmin, ray_tmax].
  //
  // `hit_fn(primitive, tmin, tmax, /*out*/ float& t) -> bool` intersects a single primitive and
  // keeps whatever hit data the caller needs. Every accepted hit shrinks `tmax`, so the last
  // accepted call holds the nearest hit. With `any_hit` the search stops at the first one.
  //
  template<typename HitFn>
  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      HitFn&& hit_fn, bool any_hit = false) const;

 private:
  struct Builder;
};


struct Bvh::Builder {
  const vector<bbox3>& bboxes;
  const BvhOptions& options;
  vector<fvec3> centers;
  vector<uint32_t>& primitives;
  vector<BvhNode>& nodes;

  // Returns the subtree bbox and depth. `base` is the first slot reserved for the descendants.
  std::pair<bbox3, uint32_t> build(
      uint32_t node_idx, uint32_t begin, uint32_t end, uint32_t base, uint32_t spawn_depth) {
    BvhNode& node = nodes[node_idx];

    //
    // Case 1. Leaf
    //
    if (end - begin <= options.max_primitive) {
      bbox3 bbox = bbox3::empty();
      for (auto p = begin; p < end; p++) {
        bbox = bbox3::opUnion(bbox, bboxes[primitives[p]]);
      }
      node.bbox = bbox;
      node.begin = begin;
      node.num_primitives = static_cast<uint8_t>(end - begin);
      node.leaf = 1;
      return {bbox, 1};
    }

    //
    // Case 2. Internal node, children at (base, base + 1)
    //
    uint8_t axis; uint32_t middle;
    Bvh::splitPrimitives(
        begin, end, centers, options.split, bboxes, /*inout*/ primitives,
        /*out*/ axis, middle);

    uint32_t num_left = middle - begin;
    uint32_t left_base = base + 2;
    uint32_t right_base = base + 2 * num_left;

    std::pair<bbox3, uint32_t> left, right;
    if (end - begin >= options.parallel_threshold && spawn_depth < options.max_spawn_depth) {
      auto left_future = std::async(std::launch::async, [&]() {
        return build(base, begin, middle, left_base, spawn_depth + 1);
      });
      right = build(base + 1, middle, end, right_base, spawn_depth + 1);
      left = left_future.get();
    } else {
      left = build(base, begin, middle, left_base, spawn_depth);
      right = build(base + 1, middle, end, right_base, spawn_depth);
    }

    // Children are joined, the union is tight by construction
    node.bbox = bbox3::opUnion(left.first, right.first);
    node.begin = base;
    node.num_primitives = 0;
    node.axis = axis;
    node.leaf = 0;
    return {node.bbox, 1 + std::max(left.second, right.second)};
  }
};


inline void Bvh::splitPrimitives(
    uint32_t begin, uint32_t end, const vector<fvec3>& centers,
    SplitPolicy policy, const vector<bbox3>& bboxes,
    /*inout*/ vector<uint32_t>& primitives,
    /*out*/ uint8_t& axis, uint32_t& middle) {
  // NOTE: primitives within [begin, end) will be shuffled

  // Choose split axis by "the longest axis" of "the bbox" of "primitive centers"
  bbox3 cbbox = bbox3::empty();
  for (auto p = begin; p < end; p++) {
    cbbox = bbox3::opUnion(cbbox, centers[primitives[p]]);
  }
  axis = opArgMax(cbbox.extent());
  float cmin = cbbox.bmin[axis];
  float cextent = cbbox.bmax[axis] - cmin;

  // If such split axis is too small, we simply split them half
  if (!(cextent > 1e-7f)) {
    middle = (begin + end) / 2;
    return;
  }

  auto first = primitives.begin() + begin;
  auto last = primitives.begin() + end;
  auto median_split = [&]() {
    middle = (begin + end) / 2;
    std::nth_element(first, primitives.begin() + middle, last,
        [&](uint32_t a, uint32_t b) { return centers[a][axis] < centers[b][axis]; });
  };

  float boundary = cmin + cextent / 2;

  if (policy == SplitPolicy::kSah) {
    constexpr int kNumBins = 16;
    auto binOf = [&](uint32_t prim) {
      int b = static_cast<int>(kNumBins * (centers[prim][axis] - cmin) / cextent);
      return std::min(b, kNumBins - 1);
    };

    uint32_t counts[kNumBins] = {};
    bbox3 bin_bboxes[kNumBins];
    std::fill(bin_bboxes, bin_bboxes + kNumBins, bbox3::empty());
    for (auto p = begin; p < end; p++) {
      int b = binOf(primitives[p]);
      counts[b]++;
      bin_bboxes[b] = bbox3::opUnion(bin_bboxes[b], bboxes[primitives[p]]);
    }

    // Sweep from the right to get suffix areas, then from the left to evaluate each boundary.
    // No leaf cost: ranges above `max_primitive` are always split.
    float right_costs[kNumBins] = {};
    bbox3 acc = bbox3::empty();
    uint32_t acc_count = 0;
    for (int b = kNumBins - 1; b > 0; b--) {
      acc = bbox3::opUnion(acc, bin_bboxes[b]);
      acc_count += counts[b];
      right_costs[b] = acc_count * acc.surfaceArea();
    }

    float best_cost = kInfinity;
    int best_bin = -1;
    acc = bbox3::empty();
    acc_count = 0;
    for (int b = 0; b < kNumBins - 1; b++) {
      acc = bbox3::opUnion(acc, bin_bboxes[b]);
      acc_count += counts[b];
      if (acc_count == 0 || acc_count == end - begin)
        continue;
      float cost = acc_count * acc.surfaceArea() + right_costs[b + 1];
      if (cost < best_cost) {
        best_cost = cost;
        best_bin = b;
      }
    }
    if (best_bin < 0) {
      median_split();
      return;
    }

    auto it = std::partition(first, last, [&](uint32_t prim) { return binOf(prim) <= best_bin; });
    middle = static_cast<uint32_t>(it - primitives.begin());
    return;
  }

  // Partition by (-oo, boundary) and [boundary, +oo)
  auto it = std::partition(first, last, [&](uint32_t prim) { return centers[prim][axis] < boundary; });
  middle = static_cast<uint32_t>(it - primitives.begin());
  if (middle == begin || middle == end) {
    median_split();
  }
}


inline Bvh Bvh::create(const vector<bbox3>& bboxes, const BvhOptions& options) {
  if (options.max_primitive < 1) {
    throw ConstructionError{"max_primitive must be at least 1"};
  }

  auto time_begin = std::chrono::steady_clock::now();
  Bvh result;
  result.options = options;

  // Empty hierarchy: a single leaf with empty-bounds sentinel
  uint32_t num_prims = static_cast<uint32_t>(bboxes.size());
  if (num_prims == 0) {
    BvhNode node;
    node.bbox = bbox3::empty();
    node.leaf = 1;
    result.nodes.push_back(node);
    result.depth = 1;
    result.num_leaves = 1;
    return result;
  }

  vector<fvec3> centers(num_prims);
  result.primitives.resize(num_prims);
  for (uint32_t i = 0; i < num_prims; i++) {
    if (!bboxes[i].isFinite() || bboxes[i].isEmpty()) {
      throw ConstructionError{format("primitive %u has invalid bounds %s", i, bboxes[i])};
    }
    result.primitives[i] = i;
    centers[i] = bboxes[i].center();
  }

  // See "Some relations" above
  vector<BvhNode> arena(2 * num_prims - 1);
  Builder builder{bboxes, options, std::move(centers), result.primitives, arena};
  result.depth = builder.build(0, 0, num_prims, 1, 0).second;

  //
  // Compact breadth first (sibling pairs stay adjacent)
  //
  result.nodes.reserve(arena.size());
  result.nodes.push_back(arena[0]);
  for (size_t i = 0; i < result.nodes.size(); i++) {
    if (result.nodes[i].isLeaf()) {
      result.num_leaves++;
      continue;
    }
    uint32_t old_begin = result.nodes[i].begin;
    result.nodes[i].begin = static_cast<uint32_t>(result.nodes.size());
    result.nodes.push_back(arena[old_begin]);
    result.nodes.push_back(arena[old_begin + 1]);
  }
  result.nodes.shrink_to_fit();

  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - time_begin);
  log::debug("bvh", "built %u primitives, %u nodes, %u leaves, depth %u (%.2f ms)",
      num_prims, (uint32_t)result.nodes.size(), result.num_leaves, result.depth, elapsed.count());
  return result;
}


template<typename HitFn>
inline bool Bvh::rayIntersect(
    const Ray& ray, float ray_tmin, float ray_tmax,
    HitFn&& hit_fn, bool any_hit) const {

  float t_root;
  if (nodes.empty() || !nodes[0].bbox.rayIntersect(ray, ray_tmin, ray_tmax, /*out*/ t_root))
    return false;

  // Use tmax as "nearest hit so far" during loop
  bool hit = false;
  float tmax = ray_tmax;

  // `stack` holds `nodes` index to traverse (occupancy is at most depth + 1)
  constexpr uint32_t kLocalStack = 64;
  uint32_t local_stack[kLocalStack];
  vector<uint32_t> heap_stack;
  uint32_t* stack = local_stack;
  if (depth + 2 > kLocalStack) {
    heap_stack.resize(depth + 2);
    stack = heap_stack.data();
  }
  uint32_t stack_size = 0;
  stack[stack_size++] = 0;

  while (stack_size > 0) {
    const BvhNode& node = nodes[stack[--stack_size]];

    if (node.isLeaf()) {
      for (auto i = 0; i < node.num_primitives; i++) {
        uint32_t prim = primitives[node.begin + i];
        float t;
        if (!hit_fn(prim, ray_tmin, tmax, /*out*/ t))
          continue;
        hit = true;
        tmax = t;
        if (any_hit)
          return true;
      }
      continue;
    }

    // Visit nearer child first (pushed last)
    float t0, t1;
    bool hit0 = nodes[node.begin + 0].bbox.rayIntersect(ray, ray_tmin, tmax, /*out*/ t0);
    bool hit1 = nodes[node.begin + 1].bbox.rayIntersect(ray, ray_tmin, tmax, /*out*/ t1);
    if (hit0 && hit1) {
      bool near_first = t0 <= t1;
      stack[stack_size++] = node.begin + (near_first ? 1 : 0);
      stack[stack_size++] = node.begin + (near_first ? 0 : 1);
    } else if (hit0) {
      stack[stack_size++] = node.begin;
    } else if (hit1) {
      stack[stack_size++] = node.begin + 1;
    }
  }

  return hit;
}


} // namespace glint
