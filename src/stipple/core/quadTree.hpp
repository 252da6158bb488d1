#pragma once

#include <opencv2/core/types.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace stippler::stipple::core {

/*! Point region quad-tree over a fixed rectangle. Stores disc centers with their radius as payload.
 *  Nodes split into four quadrants once they hold more than `capacity` entries, until `maxDepth`.
 */
class QuadTree {
public:
	struct Entry {
		cv::Point2d position;
		double radius{0.0};
	};

	explicit QuadTree(const cv::Rect2d& bounds, std::size_t capacity = 8u, int maxDepth = 16);

	//! \returns False if the position lies outside the tree bounds (nothing is inserted).
	bool insert(const Entry& entry);

	//! Append all entries within `distance` of `center` (inclusive) to `out`.
	void query(const cv::Point2d& center, double distance, std::vector<Entry>& out) const;

	std::size_t size() const {
		return m_size;
	}

private:
	struct Node {
		cv::Rect2d bounds;
		int depth{0};
		std::vector<Entry> entries{};
		std::array<std::unique_ptr<Node>, 4> children{};

		bool isLeaf() const {
			return !children[0];
		}
	};

	void split(Node& node);
	void insertInto(Node& node, const Entry& entry);
	static Node* childFor(Node& node, const cv::Point2d& position);
	static void queryNode(const Node& node, const cv::Point2d& center, double distance, std::vector<Entry>& out);

private:
	std::size_t m_capacity;
	int m_maxDepth;
	std::unique_ptr<Node> m_root;
	std::size_t m_size{0u};
};

} // namespace stippler::stipple::core
