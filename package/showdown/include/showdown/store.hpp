#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "showdown/historical.hpp"
#include "showdown/model.hpp"

namespace showdown {

// Cache of historical games keyed by game_id. put() is an upsert.
class GameStore {
public:
  virtual ~GameStore() = default;
  virtual std::optional<HistoricalGame> get(const std::string &game_id) const = 0;
  virtual void put(const HistoricalGame &game) = 0;
  virtual std::size_t count() const = 0;
  // All cached games, ordered by id.
  virtual std::vector<HistoricalGame> all() const = 0;
};

// Saved models keyed by id. list() is ranked by ranks_before().
class ModelStore {
public:
  virtual ~ModelStore() = default;
  virtual std::optional<TunedModel> get(const std::string &id) const = 0;
  virtual void put(const TunedModel &model) = 0;
  virtual bool remove(const std::string &id) = 0;
  virtual std::vector<TunedModel> list() const = 0;
};

class InMemoryGameStore : public GameStore {
public:
  std::optional<HistoricalGame> get(const std::string &game_id) const override;
  void put(const HistoricalGame &game) override;
  std::size_t count() const override;
  std::vector<HistoricalGame> all() const override;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, HistoricalGame> games_;
};

class InMemoryModelStore : public ModelStore {
public:
  std::optional<TunedModel> get(const std::string &id) const override;
  void put(const TunedModel &model) override;
  bool remove(const std::string &id) override;
  std::vector<TunedModel> list() const override;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, TunedModel> models_;
};

} // namespace showdown
