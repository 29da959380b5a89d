#pragma once

#include "criteria.hpp"
#include "observing.hpp"
#include "operation.hpp"

#include <cstddef>
#include <utility>

namespace weasel::config {

struct unset_t {};

template<typename Initializator,
         typename Evaluator,
         typename Mutation,
         typename Criterion,
         typename Observers>
class algo_config {
public:
  using initializator_t = Initializator;
  using evaluator_t = Evaluator;
  using mutation_t = Mutation;
  using criterion_t = Criterion;
  using observers_t = Observers;

public:
  inline algo_config(std::size_t batch_size,
                     initializator_t initializator,
                     evaluator_t evaluator,
                     mutation_t mutation,
                     criterion_t criterion,
                     observers_t observers)
      : batch_size_{batch_size}
      , initializator_{std::move(initializator)}
      , evaluator_{std::move(evaluator)}
      , mutation_{std::move(mutation)}
      , criterion_{std::move(criterion)}
      , observers_{std::move(observers)} {
  }

  inline auto batch_size() const noexcept {
    return batch_size_;
  }

  inline auto const& initializator() const noexcept {
    return initializator_;
  }

  inline auto const& evaluator() const noexcept {
    return evaluator_;
  }

  inline auto const& mutation() const noexcept {
    return mutation_;
  }

  inline auto const& criterion() const noexcept {
    return criterion_;
  }

  inline auto& observers() noexcept {
    return observers_;
  }

private:
  std::size_t batch_size_;
  initializator_t initializator_;
  evaluator_t evaluator_;
  mutation_t mutation_;
  criterion_t criterion_;
  observers_t observers_;
};

template<typename Initializator = unset_t,
         typename Evaluator = unset_t,
         typename Mutation = unset_t,
         typename Criterion = unset_t,
         typename Observers = observer_pack<>>
class builder {
public:
  using initializator_t = Initializator;
  using evaluator_t = Evaluator;
  using mutation_t = Mutation;
  using criterion_t = Criterion;
  using observers_t = Observers;

  template<typename I, typename E, typename M, typename C, typename O>
  friend class builder;

public:
  builder() = default;

  inline auto batch(std::size_t size) const {
    auto result = *this;
    result.batch_size_ = size;
    return result;
  }

  template<initializator Operation>
  inline auto spawn(Operation operation) const {
    return builder<Operation, Evaluator, Mutation, Criterion, Observers>{
        batch_size_,
        std::move(operation),
        evaluator_,
        mutation_,
        criterion_,
        observers_};
  }

  template<evaluator Operation>
  inline auto evaluate(Operation operation) const {
    return builder<Initializator, Operation, Mutation, Criterion, Observers>{
        batch_size_,
        initializator_,
        std::move(operation),
        mutation_,
        criterion_,
        observers_};
  }

  template<mutation Operation>
  inline auto mutate(Operation operation) const {
    return builder<Initializator, Evaluator, Operation, Criterion, Observers>{
        batch_size_,
        initializator_,
        evaluator_,
        std::move(operation),
        criterion_,
        observers_};
  }

  template<criterion Operation>
  inline auto stop(Operation operation) const {
    return builder<Initializator, Evaluator, Mutation, Operation, Observers>{
        batch_size_,
        initializator_,
        evaluator_,
        mutation_,
        std::move(operation),
        observers_};
  }

  template<typename... Observes>
  inline auto observe(Observes... observes) const {
    using pack_t = observer_pack<Observes...>;
    return builder<Initializator, Evaluator, Mutation, Criterion, pack_t>{
        batch_size_,
        initializator_,
        evaluator_,
        mutation_,
        criterion_,
        pack_t{std::move(observes)...}};
  }

  template<template<typename> class Algorithm>
    requires(initializator<Initializator> && evaluator<Evaluator> &&
             mutation<Mutation> && criterion<Criterion>)
  inline auto build() const {
    using config_t = algo_config<Initializator,
                                 Evaluator,
                                 Mutation,
                                 Criterion,
                                 Observers>;

    return Algorithm<config_t>{config_t{batch_size_,
                                        initializator_,
                                        evaluator_,
                                        mutation_,
                                        criterion_,
                                        observers_}};
  }

private:
  inline builder(std::size_t batch_size,
                 initializator_t initializator,
                 evaluator_t evaluator,
                 mutation_t mutation,
                 criterion_t criterion,
                 observers_t observers)
      : batch_size_{batch_size}
      , initializator_{std::move(initializator)}
      , evaluator_{std::move(evaluator)}
      , mutation_{std::move(mutation)}
      , criterion_{std::move(criterion)}
      , observers_{std::move(observers)} {
  }

private:
  std::size_t batch_size_{1};
  initializator_t initializator_{};
  evaluator_t evaluator_{};
  mutation_t mutation_{};
  criterion_t criterion_{};
  observers_t observers_{};
};

inline auto begin() {
  return builder<>{};
}

} // namespace weasel::config
