#include "showdown/store.hpp"

#include <mutex>

namespace showdown {

std::optional<HistoricalGame>
InMemoryGameStore::get(const std::string &game_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end())
    return std::nullopt;
  return it->second;
}

void InMemoryGameStore::put(const HistoricalGame &game) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  games_[game.game_id] = game;
}

std::size_t InMemoryGameStore::count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return games_.size();
}

std::vector<HistoricalGame> InMemoryGameStore::all() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<HistoricalGame> out;
  out.reserve(games_.size());
  for (const auto &kv : games_)
    out.push_back(kv.second);
  return out;
}

std::optional<TunedModel>
InMemoryModelStore::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = models_.find(id);
  if (it == models_.end())
    return std::nullopt;
  return it->second;
}

void InMemoryModelStore::put(const TunedModel &model) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  models_[model.id] = model;
}

bool InMemoryModelStore::remove(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return models_.erase(id) > 0;
}

std::vector<TunedModel> InMemoryModelStore::list() const {
  std::vector<TunedModel> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(models_.size());
    for (const auto &kv : models_)
      out.push_back(kv.second);
  }
  rank_models(out);
  return out;
}

} // namespace showdown
