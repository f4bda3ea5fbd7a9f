#pragma once
#include "sg/geom/Geometry.hpp"
#include "sg/ids/Id.hpp"
#include "sg/surface/Surface.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sg {

enum class NodeKind : std::uint8_t {
  Group,
  Path,
  TextItem,
  AreaText
};

inline const char* toString(NodeKind k) {
  switch (k) {
    case NodeKind::Group: return "Group";
    case NodeKind::Path: return "Path";
    case NodeKind::TextItem: return "TextItem";
    case NodeKind::AreaText: return "AreaText";
    default: return "unknown";
  }
}

// Change notification bits passed to Node::changed().
namespace Change {
  constexpr std::uint32_t Hierarchy = 1u << 0; // child inserted/removed
  constexpr std::uint32_t Geometry  = 1u << 1; // shape or matrix
  constexpr std::uint32_t Style     = 1u << 2; // colors, font
  constexpr std::uint32_t Content   = 1u << 3; // text payload
  constexpr std::uint32_t Attribute = 1u << 4; // flags, name
  constexpr std::uint32_t Clipping  = 1u << 5; // a child's clip-mask flag
}
using ChangeFlags = std::uint32_t;

// Base drawable. Children are exclusively owned; the parent pointer is a
// non-owning back reference kept in sync by insert/remove.
class Node {
public:
  virtual ~Node();

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  virtual NodeKind kind() const = 0;

  Id id() const { return id_; }
  const std::string& name() const { return name_; }
  void setName(const std::string& name);

  // ---- hierarchy ----
  Node* parent() const { return parent_; }
  const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
  std::size_t childCount() const { return children_.size(); }
  Node* childAt(std::size_t i) const;
  Node* firstChild() const { return childAt(0); }

  // Position in the parent's child list (0 when detached).
  std::size_t index() const;

  // Insert a detached node. Returns the inserted node, or nullptr (and the
  // child is destroyed) when this node kind has no children, child is null,
  // or child is this node or one of its ancestors.
  Node* addChild(std::unique_ptr<Node> child);
  Node* insertChild(std::size_t index, std::unique_ptr<Node> child);

  // Detach and return the child at `index` (nullptr when out of range).
  std::unique_ptr<Node> removeChild(std::size_t index);

  // Detach this node from its parent and hand back ownership.
  // Returns nullptr if the node has no parent.
  std::unique_ptr<Node> remove();

  virtual bool acceptsChildren() const { return false; }

  // ---- flags inspected by the parent group ----
  bool isClipMask() const { return clipMask_; }
  void setClipMask(bool clipMask);
  bool isClippable() const { return clippable_; }
  void setClippable(bool clippable);
  bool isVisible() const { return visible_; }
  void setVisible(bool visible);

  // ---- transform ----
  const Matrix& matrix() const { return matrix_; }
  void setMatrix(const Matrix& m);
  // Post-applies `m` in parent space: matrix = m * matrix.
  void transformBy(const Matrix& m);
  void translate(double dx, double dy) { transformBy(Matrix::translation(dx, dy)); }

  // ---- bounds ----
  // Local (untransformed) bounds. Default: union of children's bounds.
  virtual Rect localBounds() const;
  virtual Rect localStrokeBounds() const;
  // Bounds in the parent's coordinate space.
  Rect bounds() const { return matrix_.mapRect(localBounds()); }
  Rect strokeBounds() const { return matrix_.mapRect(localStrokeBounds()); }

  // ---- rendering ----
  // Saves surface state, applies the matrix, optionally opens a layer,
  // calls drawSelf(), and restores. Invisible nodes draw nothing.
  void draw(Surface& surface, RenderParams& params);

  // Deep copy (children included). The copy is detached and gets a new id.
  std::unique_ptr<Node> clone() const;

  // Bumped on every change notification.
  std::uint64_t version() const { return version_; }

protected:
  Node();

  virtual void drawSelf(Surface& surface, RenderParams& params);
  virtual bool wantsLayer() const { return false; }

  // Change hook. Overrides must call the base.
  virtual void changed(ChangeFlags flags);

  // Copy of this node's own fields; children and base fields are handled
  // by clone().
  virtual std::unique_ptr<Node> cloneSelf() const = 0;

  // Direct matrix access for subclasses that push transforms elsewhere.
  void resetMatrixSilently() { matrix_ = Matrix{}; }

private:
  Id id_;
  std::string name_;
  Node* parent_{nullptr};
  std::vector<std::unique_ptr<Node>> children_;
  Matrix matrix_;
  bool clipMask_{false};
  bool clippable_{true};
  bool visible_{true};
  std::uint64_t version_{0};
};

template <typename T>
std::unique_ptr<T> cloneAs(const T& node) {
  return std::unique_ptr<T>(static_cast<T*>(node.clone().release()));
}

} // namespace sg
