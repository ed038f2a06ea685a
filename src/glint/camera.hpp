#pragma once

#include "geometry.hpp"
#include "sampling.hpp"


namespace glint {

//
// Thin lens pinhole-ish camera
//
struct Camera {
  fvec3 camera_loc{1, 1, 1};
  fvec3 lookat_loc{0, 0, 0};
  fvec3 up_vec{0, 1, 0};
  float yfov = 39.0f * kPi / 180.0f;
  float aperture = 0;      // lens diameter (0 = pinhole)
  float focus_dist = 1;    // distance to the plane in focus

  // Derived by `initialize`
  int w = 1, h = 1;
  fmat3 ray_xform{1};
  fvec3 lens_x{1, 0, 0}, lens_y{0, 1, 0};

  void initialize(int in_w, int in_h) {
    w = in_w;
    h = in_h;
    fmat3 inv_view_xform = xformInvView(yfov, (float)w, (float)h);
    fmat4 camera_xform = xformLookAt(camera_loc, lookat_loc, up_vec);
    ray_xform = fmat3{camera_xform} *
                fmat3{{1, 0, 0}, {0, 1, 0}, {0, 0, -1}} *
                inv_view_xform;
    lens_x = fvec3{camera_xform[0]};
    lens_y = fvec3{camera_xform[1]};
  }

  // Pixel (x, y) with row 0 at the top. `u_pixel` jitters within the pixel, `u_lens` picks the lens point.
  Ray generateRay(int x, int y, fvec2 u_pixel, fvec2 u_lens) const {
    fvec2 frag_coord = fvec2{(float)x, (float)(h - y - 1)} + u_pixel;
    fvec3 ray_dir = ray_xform * fvec3{frag_coord, 1};
    if (aperture <= 0) {
      return Ray{camera_loc, glm::normalize(ray_dir), 0};
    }

    fvec3 focus_p = camera_loc + focus_dist * ray_dir;
    fvec2 disk = (aperture / 2.0f) * map_Square_Disk(u_lens);
    fvec3 origin = camera_loc + disk[0] * lens_x + disk[1] * lens_y;
    return Ray{origin, glm::normalize(focus_p - origin), 0};
  }
};


} // namespace glint
