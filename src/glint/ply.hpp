#pragma once

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "common.hpp"
#include "format.hpp"
#include "geometry.hpp"


namespace glint {

using std::string, std::vector;

//
// ascii format .ply mesh loader
// - "vertex" element: x y z must be the first three properties (extra properties are skipped)
// - "face" element: triangles, and quads split along their 0-2 diagonal
//

inline void loadPly(
    std::istream& istr,
    /*out*/ vector<fvec3>& vertices, vector<uvec3>& indices) {

  auto fail = [](int line_num, const string& what) {
    throw ConstructionError{format("ply:%d: %s", line_num, what)};
  };

  // header data
  int num_verts = -1;
  int num_faces = -1;
  bool end_header = false;

  // parser states
  int line_num = 1;
  string line;

  // Parse header
  for (; std::getline(istr, line); line_num++) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line_num == 1 && line != "ply") fail(line_num, "missing magic \"ply\"");
    if (line_num == 2 && line != "format ascii 1.0") fail(line_num, "only \"format ascii 1.0\" is supported");
    if (num_verts == -1) {
      std::sscanf(line.c_str(), "element vertex %d", &num_verts);
    }
    if (num_faces == -1) {
      std::sscanf(line.c_str(), "element face %d", &num_faces);
    }
    if (line == "end_header") {
      end_header = true;
      line_num++;
      break;
    }
  }
  if (!end_header) fail(line_num, "missing end_header");
  if (num_verts < 0) fail(line_num, "missing \"element vertex\"");
  if (num_faces < 0) fail(line_num, "missing \"element face\"");

  // Parse vertex data
  vertices.resize(num_verts);
  for (int i = 0; i < num_verts; i++, line_num++) {
    if (!std::getline(istr, line)) fail(line_num, "unexpected end of vertex data");
    auto& v = vertices[i];
    if (std::sscanf(line.c_str(), "%f %f %f", &v[0], &v[1], &v[2]) != 3)
      fail(line_num, format("bad vertex \"%s\"", line));
  }

  // Parse face data
  indices.clear();
  indices.reserve(num_faces);
  for (int i = 0; i < num_faces; i++, line_num++) {
    if (!std::getline(istr, line)) fail(line_num, "unexpected end of face data");
    std::istringstream face{line};
    int n = 0;
    face >> n;
    if (n != 3 && n != 4) fail(line_num, format("only triangle and quad faces are supported (got %d)", n));
    int64_t idx[4] = {};
    for (int k = 0; k < n; k++) {
      if (!(face >> idx[k])) fail(line_num, format("bad face \"%s\"", line));
      if (idx[k] < 0 || idx[k] >= num_verts) fail(line_num, format("face index %d out of range", (int)idx[k]));
    }
    indices.push_back(uvec3(idx[0], idx[1], idx[2]));
    if (n == 4) {
      indices.push_back(uvec3(idx[0], idx[2], idx[3]));
    }
  }
}

inline void loadPly(
    const string& filename,
    /*out*/ vector<fvec3>& vertices, vector<uvec3>& indices) {
  std::ifstream ifs(filename);
  if (!ifs.is_open())
    throw ConstructionError{format("cannot open \"%s\"", filename)};
  loadPly(ifs, vertices, indices);
  log::debug("ply", "%s: %d vertices, %d triangles", filename, (int)vertices.size(), (int)indices.size());
}


} // namespace glint
