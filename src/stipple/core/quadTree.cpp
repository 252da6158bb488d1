#include "quadTree.hpp"

#include <algorithm>
#include <cmath>

namespace stippler::stipple::core {

static bool contains(const cv::Rect2d& r, const cv::Point2d& p) {
	return p.x >= r.x && p.y >= r.y && p.x < r.x + r.width && p.y < r.y + r.height;
}

//! Squared distance from a point to the closest point of a rectangle (0 inside).
static double squaredDistanceTo(const cv::Rect2d& r, const cv::Point2d& p) {
	const double dx = std::max({r.x - p.x, 0.0, p.x - (r.x + r.width)});
	const double dy = std::max({r.y - p.y, 0.0, p.y - (r.y + r.height)});
	return dx * dx + dy * dy;
}

QuadTree::QuadTree(const cv::Rect2d& bounds, const std::size_t capacity, const int maxDepth)
    : m_capacity{std::max<std::size_t>(1u, capacity)}, m_maxDepth{maxDepth}, m_root{std::make_unique<Node>()} {
	m_root->bounds = bounds;
}

bool QuadTree::insert(const Entry& entry) {
	if (!contains(m_root->bounds, entry.position)) {
		return false;
	}
	insertInto(*m_root, entry);
	++m_size;
	return true;
}

void QuadTree::insertInto(Node& node, const Entry& entry) {
	Node* current = &node;
	while (!current->isLeaf()) {
		current = childFor(*current, entry.position);
	}

	current->entries.push_back(entry);
	if (current->entries.size() > m_capacity && current->depth < m_maxDepth) {
		split(*current);
	}
}

void QuadTree::split(Node& node) {
	const double halfW = node.bounds.width / 2.0;
	const double halfH = node.bounds.height / 2.0;
	const double x0    = node.bounds.x;
	const double y0    = node.bounds.y;

	// Quadrant order: top-left, top-right, bottom-left, bottom-right.
	const std::array<cv::Rect2d, 4> quadrants = {
	        cv::Rect2d(x0, y0, halfW, halfH),
	        cv::Rect2d(x0 + halfW, y0, node.bounds.width - halfW, halfH),
	        cv::Rect2d(x0, y0 + halfH, halfW, node.bounds.height - halfH),
	        cv::Rect2d(x0 + halfW, y0 + halfH, node.bounds.width - halfW, node.bounds.height - halfH),
	};
	for (std::size_t q = 0; q < 4u; ++q) {
		node.children[q]         = std::make_unique<Node>();
		node.children[q]->bounds = quadrants[q];
		node.children[q]->depth  = node.depth + 1;
	}

	std::vector<Entry> entries = std::move(node.entries);
	node.entries.clear();
	for (const auto& e: entries) {
		childFor(node, e.position)->entries.push_back(e);
	}
	// Entries all in one quadrant are split further on the next insertion there.
}

QuadTree::Node* QuadTree::childFor(Node& node, const cv::Point2d& position) {
	const double midX  = node.bounds.x + node.bounds.width / 2.0;
	const double midY  = node.bounds.y + node.bounds.height / 2.0;
	const std::size_t q = (position.x >= midX ? 1u : 0u) + (position.y >= midY ? 2u : 0u);
	return node.children[q].get();
}

void QuadTree::query(const cv::Point2d& center, const double distance, std::vector<Entry>& out) const {
	queryNode(*m_root, center, distance, out);
}

void QuadTree::queryNode(const Node& node, const cv::Point2d& center, const double distance, std::vector<Entry>& out) {
	const double distanceSq = distance * distance;
	if (squaredDistanceTo(node.bounds, center) > distanceSq) {
		return;
	}

	if (node.isLeaf()) {
		for (const auto& e: node.entries) {
			const cv::Point2d d = e.position - center;
			if (d.dot(d) <= distanceSq) {
				out.push_back(e);
			}
		}
		return;
	}

	for (const auto& child: node.children) {
		queryNode(*child, center, distance, out);
	}
}

} // namespace stippler::stipple::core
