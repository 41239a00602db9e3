// seiri/analysis/graph_analysis.cpp - Kosaraju SCC and Brandes betweenness
#include "seiri/analysis/graph_analysis.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace seiri
{

namespace
{

using Adjacency = std::vector<std::vector<size_t>>;

/// Postorder of an iterative DFS over every vertex
std::vector<size_t> finish_order(const Adjacency & adj)
{
  const size_t n = adj.size();
  std::vector<bool> visited(n, false);
  std::vector<size_t> order;
  order.reserve(n);

  for (size_t root = 0; root < n; ++root) {
    if (visited[root]) {
      continue;
    }
    std::vector<std::pair<size_t, size_t>> stack;  // (vertex, next neighbor)
    stack.emplace_back(root, 0);
    visited[root] = true;
    while (!stack.empty()) {
      auto & [v, next] = stack.back();
      if (next < adj[v].size()) {
        const size_t w = adj[v][next++];
        if (!visited[w]) {
          visited[w] = true;
          stack.emplace_back(w, 0);
        }
      } else {
        order.push_back(v);
        stack.pop_back();
      }
    }
  }
  return order;
}

std::vector<std::vector<size_t>> strongly_connected(const Adjacency & adj)
{
  const size_t n = adj.size();
  Adjacency reversed(n);
  for (size_t v = 0; v < n; ++v) {
    for (const size_t w : adj[v]) {
      reversed[w].push_back(v);
    }
  }

  const auto order = finish_order(adj);
  std::vector<bool> assigned(n, false);
  std::vector<std::vector<size_t>> out;

  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    if (assigned[*it]) {
      continue;
    }
    std::vector<size_t> component;
    std::vector<size_t> stack{*it};
    assigned[*it] = true;
    while (!stack.empty()) {
      const size_t v = stack.back();
      stack.pop_back();
      component.push_back(v);
      for (const size_t w : reversed[v]) {
        if (!assigned[w]) {
          assigned[w] = true;
          stack.push_back(w);
        }
      }
    }
    std::sort(component.begin(), component.end());
    out.push_back(std::move(component));
  }

  std::sort(out.begin(), out.end(), [](const auto & a, const auto & b) {
    return a.front() < b.front();
  });
  return out;
}

std::vector<double> brandes(const Adjacency & adj)
{
  const size_t n = adj.size();
  std::vector<double> centrality(n, 0.0);

  for (size_t s = 0; s < n; ++s) {
    std::vector<size_t> stack;
    std::vector<std::vector<size_t>> pred(n);
    std::vector<double> sigma(n, 0.0);
    std::vector<long> dist(n, -1);
    std::vector<double> delta(n, 0.0);
    std::deque<size_t> queue;

    sigma[s] = 1.0;
    dist[s] = 0;
    queue.push_back(s);

    while (!queue.empty()) {
      const size_t v = queue.front();
      queue.pop_front();
      stack.push_back(v);
      for (const size_t w : adj[v]) {
        if (dist[w] < 0) {
          queue.push_back(w);
          dist[w] = dist[v] + 1;
        }
        if (dist[w] == dist[v] + 1) {
          sigma[w] += sigma[v];
          pred[w].push_back(v);
        }
      }
    }

    while (!stack.empty()) {
      const size_t w = stack.back();
      stack.pop_back();
      for (const size_t v : pred[w]) {
        delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
      }
      if (w != s) {
        centrality[w] += delta[w];
      }
    }
  }

  if (n > 2) {
    const double norm = 1.0 / static_cast<double>((n - 1) * (n - 2));
    for (auto & c : centrality) {
      c *= norm;
    }
  }
  return centrality;
}

}  // namespace

std::vector<std::vector<NodeId>> GraphAnalysis::cycles() const
{
  std::vector<std::vector<NodeId>> out;
  std::copy_if(
    components.begin(), components.end(), std::back_inserter(out),
    [](const std::vector<NodeId> & c) { return c.size() > 1; });
  return out;
}

GraphAnalysis analyze_graph(const Graph & graph)
{
  GraphAnalysis result;

  std::unordered_map<NodeId, size_t> local;
  for (const auto & node : graph.nodes()) {
    if (node.kind() == NodeKind::File) {
      local.emplace(node.id, result.files.size());
      result.files.push_back(node.id);
    }
  }
  if (result.files.empty()) {
    return result;
  }

  Adjacency adj(result.files.size());
  for (const auto & e : graph.edges()) {
    if (e.kind != EdgeKind::Imports) {
      continue;
    }
    const auto s = local.find(e.source);
    const auto t = local.find(e.target);
    if (s != local.end() && t != local.end()) {
      adj[s->second].push_back(t->second);
    }
  }
  for (auto & neighbors : adj) {
    std::sort(neighbors.begin(), neighbors.end());
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
  }

  for (const auto & component : strongly_connected(adj)) {
    std::vector<NodeId> ids;
    ids.reserve(component.size());
    for (const size_t v : component) {
      ids.push_back(result.files[v]);
      result.component_of[result.files[v]] = result.components.size();
    }
    if (ids.size() > result.largest_component.size()) {
      result.largest_component = ids;
    }
    result.components.push_back(std::move(ids));
  }

  const auto scores = brandes(adj);
  for (size_t v = 0; v < scores.size(); ++v) {
    result.betweenness[result.files[v]] = scores[v];
  }
  return result;
}

}  // namespace seiri
