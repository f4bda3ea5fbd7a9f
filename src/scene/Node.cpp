#include "sg/scene/Node.hpp"

#include <algorithm>

namespace sg {

Node::Node() : id_(nextNodeId()) {}

Node::~Node() {
  for (auto& c : children_) c->parent_ = nullptr;
}

void Node::setName(const std::string& name) {
  name_ = name;
  changed(Change::Attribute);
}

Node* Node::childAt(std::size_t i) const {
  return i < children_.size() ? children_[i].get() : nullptr;
}

std::size_t Node::index() const {
  if (!parent_) return 0;
  const auto& sib = parent_->children_;
  for (std::size_t i = 0; i < sib.size(); i++) {
    if (sib[i].get() == this) return i;
  }
  return 0;
}

Node* Node::addChild(std::unique_ptr<Node> child) {
  return insertChild(children_.size(), std::move(child));
}

Node* Node::insertChild(std::size_t index, std::unique_ptr<Node> child) {
  if (!child || !acceptsChildren()) return nullptr;
  for (const Node* n = this; n; n = n->parent_) {
    if (n == child.get()) return nullptr;
  }
  index = std::min(index, children_.size());
  Node* raw = child.get();
  raw->parent_ = this;
  children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
  raw->changed(Change::Hierarchy);
  changed(Change::Hierarchy);
  return raw;
}

std::unique_ptr<Node> Node::removeChild(std::size_t index) {
  if (index >= children_.size()) return nullptr;
  std::unique_ptr<Node> out = std::move(children_[index]);
  children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
  out->parent_ = nullptr;
  out->changed(Change::Hierarchy);
  changed(Change::Hierarchy);
  return out;
}

std::unique_ptr<Node> Node::remove() {
  if (!parent_) return nullptr;
  return parent_->removeChild(index());
}

void Node::setClipMask(bool clipMask) {
  if (clipMask_ == clipMask) return;
  clipMask_ = clipMask;
  changed(Change::Attribute);
  if (parent_) parent_->changed(Change::Clipping);
}

void Node::setClippable(bool clippable) {
  if (clippable_ == clippable) return;
  clippable_ = clippable;
  changed(Change::Attribute);
}

void Node::setVisible(bool visible) {
  if (visible_ == visible) return;
  visible_ = visible;
  changed(Change::Attribute);
}

void Node::setMatrix(const Matrix& m) {
  matrix_ = m;
  changed(Change::Geometry);
}

void Node::transformBy(const Matrix& m) {
  setMatrix(m.multiplied(matrix_));
}

Rect Node::localBounds() const {
  Rect acc;
  bool has = false;
  for (const auto& c : children_) {
    if (!c->isVisible()) continue;
    unite(acc, has, c->bounds());
  }
  return acc;
}

Rect Node::localStrokeBounds() const {
  Rect acc;
  bool has = false;
  for (const auto& c : children_) {
    if (!c->isVisible()) continue;
    unite(acc, has, c->strokeBounds());
  }
  return acc;
}

void Node::draw(Surface& surface, RenderParams& params) {
  if (!visible_) return;
  surface.save();
  if (!matrix_.isIdentity()) surface.transform(matrix_);
  bool layered = wantsLayer();
  if (layered) surface.beginLayer();
  drawSelf(surface, params);
  if (layered) surface.endLayer();
  surface.restore();
}

void Node::drawSelf(Surface&, RenderParams&) {}

void Node::changed(ChangeFlags) {
  version_++;
}

std::unique_ptr<Node> Node::clone() const {
  std::unique_ptr<Node> copy = cloneSelf();
  for (const auto& c : children_) copy->addChild(c->clone());

  // Base fields last so a group's matrix is not pushed into the copied
  // children a second time.
  copy->name_ = name_;
  copy->matrix_ = matrix_;
  copy->clipMask_ = clipMask_;
  copy->clippable_ = clippable_;
  copy->visible_ = visible_;
  copy->changed(Change::Attribute | Change::Clipping);
  return copy;
}

} // namespace sg
