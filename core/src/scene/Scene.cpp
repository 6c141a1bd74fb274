#include "qc/scene/Scene.hpp"
#include <algorithm>

namespace qc {

namespace {

template <typename Map>
std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

template <typename Map>
auto findPtr(const Map& m, Id id) -> const typename Map::mapped_type* {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

} // anonymous namespace

bool Scene::hasPane(Id id) const      { return panes_.find(id) != panes_.end(); }
bool Scene::hasLayer(Id id) const     { return layers_.find(id) != layers_.end(); }
bool Scene::hasDrawItem(Id id) const  { return drawItems_.find(id) != drawItems_.end(); }
bool Scene::hasBuffer(Id id) const    { return buffers_.find(id) != buffers_.end(); }
bool Scene::hasGeometry(Id id) const  { return geometries_.find(id) != geometries_.end(); }
bool Scene::hasTransform(Id id) const { return transforms_.find(id) != transforms_.end(); }

const Pane* Scene::getPane(Id id) const           { return findPtr(panes_, id); }
const Layer* Scene::getLayer(Id id) const         { return findPtr(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const   { return findPtr(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const       { return findPtr(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const   { return findPtr(geometries_, id); }
const Transform* Scene::getTransform(Id id) const { return findPtr(transforms_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) {
  auto it = drawItems_.find(id);
  return it == drawItems_.end() ? nullptr : &it->second;
}

Transform* Scene::getTransformMutable(Id id) {
  auto it = transforms_.find(id);
  return it == transforms_.end() ? nullptr : &it->second;
}

void Scene::addPane(Pane p)           { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)         { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d)   { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)       { buffers_[b.id] = b; }
void Scene::addGeometry(Geometry g)   { geometries_[g.id] = g; }
void Scene::addTransform(Transform t) { transforms_[t.id] = t; }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  if (drawItems_.erase(drawItemId) == 0) return {};
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  auto it = layers_.find(layerId);
  if (it == layers_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  // cascade delete draw items
  std::vector<Id> toDelete;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) toDelete.push_back(kv.first);
  }
  for (Id id : toDelete) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }

  layers_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  auto it = panes_.find(paneId);
  if (it == panes_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  std::vector<Id> layersToDelete;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) layersToDelete.push_back(kv.first);
  }
  for (Id lid : layersToDelete) {
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }

  panes_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  if (buffers_.erase(bufferId) == 0) return {};
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  if (geometries_.erase(geometryId) == 0) return {};
  return {geometryId};
}

std::vector<Id> Scene::deleteTransform(Id transformId) {
  if (transforms_.erase(transformId) == 0) return {};
  // Detach from any draw item still referencing it.
  for (auto& kv : drawItems_) {
    if (kv.second.transformId == transformId) kv.second.transformId = 0;
  }
  return {transformId};
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }

bool Scene::empty() const {
  return panes_.empty() && layers_.empty() && drawItems_.empty() &&
         buffers_.empty() && geometries_.empty() && transforms_.empty();
}

} // namespace qc
