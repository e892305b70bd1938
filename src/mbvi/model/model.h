/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "mbvi/types.h"

namespace mbvi {
namespace model {

using SiteID = uint;

// Per-instance shape of a site. A LOCAL or OBSERVED site of shape r x c
// restricted to a batch of size M occupies M x (r * c) values.
struct Shape {
  uint rows;
  uint cols;

  Shape() : rows(0), cols(0) {}
  Shape(uint rows, uint cols) : rows(rows), cols(cols) {}
  uint size() const {
    return rows * cols;
  }
  bool operator==(const Shape& other) const {
    return rows == other.rows and cols == other.cols;
  }
  bool operator!=(const Shape& other) const {
    return not(*this == other);
  }
  std::string to_string() const;
};

struct Site {
  SiteID index; // index in Model::sites()
  std::string name;
  SiteKind kind;
  VariationalFamily family;
  Shape shape;
  std::vector<SiteID> parents;
  std::vector<SiteID> children;

  bool is_latent() const {
    return kind == SiteKind::GLOBAL or kind == SiteKind::LOCAL;
  }
  // LOCAL and OBSERVED sites live on the data plate and are subsampled.
  bool is_subsampled() const {
    return kind == SiteKind::LOCAL or kind == SiteKind::OBSERVED;
  }
};

/*
A hierarchical model: named random-variable sites that are either global
(one instance), local (one instance per data index) or observed (one
observation per data index). Sites are added in topological order; the
parents of a site must already exist, so the dependence structure is
acyclic by construction. Allowed edges are global -> global, global ->
local, local -> local and latent -> observed.
*/
class Model {
 public:
  Model() {}

  /*
  Add a site shared by the whole data set.
  :param name: unique site name
  :param shape: shape of the single instance
  :param family: NORMAL (KLqp) or EMPIRICAL (sampling-based inference)
  :param parents: global parent sites
  :returns: the id of the new site
  */
  SiteID add_global(
      const std::string& name,
      Shape shape,
      VariationalFamily family = VariationalFamily::NORMAL,
      const std::vector<SiteID>& parents = {});
  /*
  Add a latent site with one instance per data index.
  :param family: CATEGORICAL or NORMAL
  :param parents: global or local parent sites
  */
  SiteID add_local(
      const std::string& name,
      Shape shape,
      VariationalFamily family = VariationalFamily::CATEGORICAL,
      const std::vector<SiteID>& parents = {});
  // Add an observed site with one observation per data index.
  SiteID add_observed(
      const std::string& name,
      Shape shape,
      const std::vector<SiteID>& parents);

  bool has_site(const std::string& name) const;
  // throws UnknownSiteError
  const Site& site(const std::string& name) const;
  const Site& site(SiteID id) const;
  const std::vector<Site>& sites() const {
    return _sites;
  }
  uint num_sites() const {
    return static_cast<uint>(_sites.size());
  }
  std::vector<SiteID> sites_of_kind(SiteKind kind) const;
  std::string to_string() const;

 private:
  SiteID add_site(
      const std::string& name,
      SiteKind kind,
      VariationalFamily family,
      Shape shape,
      const std::vector<SiteID>& parents);
  void check_parent(SiteKind kind, const Site& parent) const;

  std::vector<Site> _sites;
  std::map<std::string, SiteID> _index;
};

} // namespace model
} // namespace mbvi
