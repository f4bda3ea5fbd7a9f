#pragma once
#include "sg/scene/Node.hpp"
#include "sg/surface/CompositeOp.hpp"

#include <memory>
#include <vector>

namespace sg {

// A collection of nodes treated as one unit.
//
// Children flagged as clip masks are painted with the group's compositing
// operator (source-in by default), which masks whatever the group painted
// before them. While the group has any clip mask, children that are not
// clippable are held back and painted after the whole pass, in their
// original order, so no mask in this group can ever affect them.
class Group : public Node {
public:
  Group() = default;
  explicit Group(std::vector<std::unique_ptr<Node>> children);

  NodeKind kind() const override { return NodeKind::Group; }
  bool acceptsChildren() const override { return true; }

  CompositeOp compositing() const { return compositing_; }
  void setCompositing(CompositeOp op);

  // Children currently flagged as clip masks, in list order. Rebuilt lazily
  // after any hierarchy or clipping change.
  const std::vector<Node*>& clipItems() const;

  bool isClipped() const { return !clipItems().empty(); }

  // Sets the clip-mask flag of the first child. No-op on an empty group.
  void setClipped(bool clipped);

  // When true the group keeps an identity matrix: any transform applied to
  // it is pushed into the children.
  bool transformContent() const { return transformContent_; }
  void setTransformContent(bool transform);

  // Push the group's matrix into each child and reset it to identity.
  // Without children the matrix is kept.
  void applyMatrix();

protected:
  void drawSelf(Surface& surface, RenderParams& params) override;
  bool wantsLayer() const override { return isClipped(); }
  void changed(ChangeFlags flags) override;
  std::unique_ptr<Node> cloneSelf() const override;

private:
  CompositeOp compositing_{CompositeOp::SourceIn};
  bool transformContent_{true};

  mutable std::vector<Node*> clipItems_;
  mutable bool clipItemsDirty_{true};
};

} // namespace sg
