/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptor/transformed.hpp>

#include "mbvi/errors.h"
#include "mbvi/model/model.h"

namespace mbvi {
namespace model {

std::string Shape::to_string() const {
  return std::to_string(rows) + "x" + std::to_string(cols);
}

SiteID Model::add_global(
    const std::string& name,
    Shape shape,
    VariationalFamily family,
    const std::vector<SiteID>& parents) {
  if (family != VariationalFamily::NORMAL and
      family != VariationalFamily::EMPIRICAL) {
    throw std::invalid_argument(
        "global site '" + name + "' must use a NORMAL or EMPIRICAL family");
  }
  return add_site(name, SiteKind::GLOBAL, family, shape, parents);
}

SiteID Model::add_local(
    const std::string& name,
    Shape shape,
    VariationalFamily family,
    const std::vector<SiteID>& parents) {
  if (family != VariationalFamily::CATEGORICAL and
      family != VariationalFamily::NORMAL) {
    throw std::invalid_argument(
        "local site '" + name + "' must use a CATEGORICAL or NORMAL family");
  }
  return add_site(name, SiteKind::LOCAL, family, shape, parents);
}

SiteID Model::add_observed(
    const std::string& name,
    Shape shape,
    const std::vector<SiteID>& parents) {
  if (parents.empty()) {
    throw std::invalid_argument(
        "observed site '" + name + "' must depend on a latent site");
  }
  return add_site(
      name, SiteKind::OBSERVED, VariationalFamily::NONE, shape, parents);
}

void Model::check_parent(SiteKind kind, const Site& parent) const {
  if (parent.kind == SiteKind::OBSERVED) {
    throw std::invalid_argument(
        "observed site '" + parent.name + "' cannot be a parent");
  }
  if (kind == SiteKind::GLOBAL and parent.kind != SiteKind::GLOBAL) {
    throw std::invalid_argument(
        "a global site can only depend on global sites, not on '" +
        parent.name + "'");
  }
}

SiteID Model::add_site(
    const std::string& name,
    SiteKind kind,
    VariationalFamily family,
    Shape shape,
    const std::vector<SiteID>& parents) {
  if (name.empty()) {
    throw std::invalid_argument("site name must not be empty");
  }
  if (_index.find(name) != _index.end()) {
    throw std::invalid_argument("duplicate site name '" + name + "'");
  }
  if (shape.size() == 0) {
    throw std::invalid_argument("site '" + name + "' has an empty shape");
  }
  for (SiteID parent : parents) {
    if (parent >= _sites.size()) {
      throw std::out_of_range(
          "parent id " + std::to_string(parent) + " of site '" + name +
          "' does not exist");
    }
    check_parent(kind, _sites[parent]);
  }
  SiteID id = static_cast<SiteID>(_sites.size());
  Site site;
  site.index = id;
  site.name = name;
  site.kind = kind;
  site.family = family;
  site.shape = shape;
  site.parents = parents;
  for (SiteID parent : parents) {
    _sites[parent].children.push_back(id);
  }
  _sites.push_back(std::move(site));
  _index[name] = id;
  return id;
}

bool Model::has_site(const std::string& name) const {
  return _index.find(name) != _index.end();
}

const Site& Model::site(const std::string& name) const {
  auto it = _index.find(name);
  if (it == _index.end()) {
    throw UnknownSiteError(name);
  }
  return _sites[it->second];
}

const Site& Model::site(SiteID id) const {
  if (id >= _sites.size()) {
    throw std::out_of_range("site id " + std::to_string(id) + " is invalid");
  }
  return _sites[id];
}

std::vector<SiteID> Model::sites_of_kind(SiteKind kind) const {
  std::vector<SiteID> result;
  for (const Site& site : _sites) {
    if (site.kind == kind) {
      result.push_back(site.index);
    }
  }
  return result;
}

std::string Model::to_string() const {
  using boost::adaptors::transformed;
  using boost::algorithm::join;
  std::ostringstream os;
  for (const Site& site : _sites) {
    auto parent_name = [this](SiteID id) { return _sites[id].name; };
    os << site.index << ": " << site.name << " " << mbvi::to_string(site.kind)
       << " " << site.shape.to_string() << " "
       << mbvi::to_string(site.family) << " ("
       << join(site.parents | transformed(parent_name), ", ") << ")"
       << std::endl;
  }
  return os.str();
}

} // namespace model
} // namespace mbvi
