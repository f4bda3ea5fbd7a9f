#include "sg/scene/Group.hpp"

namespace sg {

Group::Group(std::vector<std::unique_ptr<Node>> children) {
  for (auto& c : children) addChild(std::move(c));
}

void Group::setCompositing(CompositeOp op) {
  compositing_ = op;
  changed(Change::Style);
}

const std::vector<Node*>& Group::clipItems() const {
  if (clipItemsDirty_) {
    clipItems_.clear();
    for (const auto& c : children()) {
      if (c->isClipMask()) clipItems_.push_back(c.get());
    }
    clipItemsDirty_ = false;
  }
  return clipItems_;
}

void Group::setClipped(bool clipped) {
  if (Node* first = firstChild()) first->setClipMask(clipped);
}

void Group::setTransformContent(bool transform) {
  transformContent_ = transform;
  if (transform) applyMatrix();
}

void Group::applyMatrix() {
  // An empty group keeps its matrix until children arrive.
  if (matrix().isIdentity() || children().empty()) return;
  Matrix m = matrix();
  for (const auto& c : children()) c->setMatrix(m.multiplied(c->matrix()));
  resetMatrixSilently();
  Node::changed(Change::Geometry);
}

void Group::changed(ChangeFlags flags) {
  Node::changed(flags);
  if (flags & (Change::Hierarchy | Change::Clipping)) {
    clipItemsDirty_ = true;
  }
  if ((flags & (Change::Hierarchy | Change::Geometry)) && transformContent_ &&
      !matrix().isIdentity()) {
    applyMatrix();
  }
}

void Group::drawSelf(Surface& surface, RenderParams& params) {
  const bool hasClipItems = !clipItems().empty();
  if (hasClipItems) {
    Rect b = strokeBounds();
    if (b.width == 0 || b.height == 0) return;
    params.offset = floorPoint(b.topLeft());
    params.hasOffset = true;
  }

  std::vector<Node*> deferred;
  for (const auto& child : children()) {
    Node* item = child.get();
    if (item->isClipMask()) {
      CompositeOp saved = surface.compositeOp();
      surface.setCompositeOp(compositing_);
      item->draw(surface, params);
      surface.setCompositeOp(saved);
    } else if (hasClipItems && !item->isClippable()) {
      deferred.push_back(item);
    } else {
      item->draw(surface, params);
    }
  }

  // Painted after every mask of this pass so none of them can touch it.
  for (Node* item : deferred) item->draw(surface, params);
}

std::unique_ptr<Node> Group::cloneSelf() const {
  auto g = std::make_unique<Group>();
  g->compositing_ = compositing_;
  g->transformContent_ = transformContent_;
  return g;
}

} // namespace sg
