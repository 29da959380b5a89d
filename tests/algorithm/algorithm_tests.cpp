#include <algorithm.hpp>
#include <mutation.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <random>
#include <stop_token>
#include <string>
#include <vector>

namespace tests::algorithm {

class scripted_mutations {
public:
  inline scripted_mutations(std::initializer_list<std::string> seq)
      : seq_{seq} {
  }

  inline void operator()(std::string& target) {
    target = seq_[current_++];
  }

  inline auto calls() const noexcept {
    return current_;
  }

private:
  std::vector<std::string> seq_;
  std::size_t current_{0};
};

struct algorithm_tests : public ::testing::Test {
protected:
  template<typename Initializator, typename Mutation>
  auto make(std::string const& target,
            std::size_t batch,
            Initializator&& init,
            Mutation&& mutate) {
    return weasel::config::begin()
        .batch(batch)
        .spawn(std::forward<Initializator>(init))
        .evaluate(weasel::matching{target})
        .mutate(std::forward<Mutation>(mutate))
        .stop(weasel::criteria::exact_match{target})
        .observe(weasel::observe{weasel::start_event,
                                 [this](weasel::candidate const& best) {
                                   start_ = best;
                                 }},
                 weasel::observe{weasel::generation_event,
                                 [this](weasel::candidate const& best,
                                        weasel::stats::history const& h) {
                                   generations_.push_back(best);
                                   numbers_.push_back(h.current().number());
                                 }})
        .template build<weasel::algo>();
  }

  auto chromosomes() const {
    std::vector<std::string> result{};
    for (auto&& c : generations_) {
      result.push_back(c.chromosome());
    }
    return result;
  }

  weasel::candidate start_{};
  std::vector<weasel::candidate> generations_{};
  std::vector<std::size_t> numbers_{};
};

TEST_F(algorithm_tests, start_is_reported_before_generations) {
  // arrange
  scripted_mutations script{"AB", "BB"};
  auto algo = make(
      "BB", 1, [] { return std::string{"AA"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_EQ(start_.chromosome(), "AA");
  EXPECT_EQ(start_.fitness(), 0);
  EXPECT_THAT(chromosomes(), ::testing::ElementsAre("AB", "BB"));
  EXPECT_THAT(numbers_, ::testing::ElementsAre(0, 1));
}

TEST_F(algorithm_tests, first_best_of_batch_wins_tie) {
  // arrange
  scripted_mutations script{"BA", "AB", "AA", "BB", "BB", "BB"};
  auto algo = make(
      "BB", 3, [] { return std::string{"AA"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_THAT(chromosomes(), ::testing::ElementsAre("BA", "BB"));
}

TEST_F(algorithm_tests, equal_score_does_not_replace_best) {
  // arrange
  scripted_mutations script{"CA", "AC", "AB", "BB"};
  auto algo = make(
      "BB", 2, [] { return std::string{"AB"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_THAT(chromosomes(), ::testing::ElementsAre("AB", "BB"));
}

TEST_F(algorithm_tests, mutates_current_best) {
  // arrange
  std::vector<std::string> bases{};
  scripted_mutations script{"BA", "BB"};
  auto algo = make(
      "BB",
      1,
      [] { return std::string{"AA"}; },
      [&script, &bases](std::string& c) {
        bases.push_back(c);
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_THAT(bases, ::testing::ElementsAre("AA", "BA"));
}

TEST_F(algorithm_tests, batch_size_mutations_per_generation) {
  // arrange
  scripted_mutations script{"AA", "AA", "AA", "AA", "BB", "AA"};
  auto algo = make(
      "BB", 3, [] { return std::string{"AA"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_EQ(script.calls(), 6);
  EXPECT_EQ(algo.statistics().total_evaluations(), 6);
  EXPECT_THAT(chromosomes(), ::testing::ElementsAre("AA", "BB"));
}

TEST_F(algorithm_tests, converged_state_after_run) {
  // arrange
  scripted_mutations script{"BB"};
  auto algo = make(
      "BB", 1, [] { return std::string{"AA"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  auto const& best = algo.run(std::stop_token{});

  // assert
  EXPECT_EQ(algo.state(), weasel::algo_state::converged);
  EXPECT_EQ(best.chromosome(), "BB");
  EXPECT_EQ(best.fitness(), 2);
}

TEST_F(algorithm_tests, matching_start_still_runs_one_generation) {
  // arrange
  scripted_mutations script{"AB"};
  auto algo = make(
      "BB", 1, [] { return std::string{"BB"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(std::stop_token{});

  // assert
  EXPECT_EQ(start_.chromosome(), "BB");
  EXPECT_THAT(chromosomes(), ::testing::ElementsAre("BB"));
}

TEST_F(algorithm_tests, stop_request_ends_run) {
  // arrange
  std::stop_source stop{};
  stop.request_stop();

  scripted_mutations script{"AA"};
  auto algo = make(
      "BB", 1, [] { return std::string{"AA"}; }, [&script](std::string& c) {
        script(c);
      });

  // act
  algo.run(stop.get_token());

  // assert
  EXPECT_EQ(algo.state(), weasel::algo_state::evaluating);
  EXPECT_EQ(generations_.size(), 1);
}

TEST_F(algorithm_tests, sampling_error_propagates) {
  // arrange
  std::mt19937 rng{};
  weasel::generator_source source{rng};
  weasel::charset empty{};

  auto algo = make("GO",
                   10,
                   weasel::spawn{source, empty, 2},
                   weasel::mutate::replace{source, empty, 100});

  // act & assert
  EXPECT_THROW(algo.run(std::stop_token{}), weasel::error);
  EXPECT_TRUE(generations_.empty());
}

TEST_F(algorithm_tests, best_fitness_never_decreases) {
  // arrange
  std::string const target{"METHINKS IT IS LIKE A WEASEL"};

  std::mt19937 rng{42};
  weasel::generator_source source{rng};
  weasel::charset chars{"ABCDEFGHIJKLMNOPQRSTUVWXYZ "};

  auto algo = make(target,
                   100,
                   weasel::spawn{source, chars, target.size()},
                   weasel::mutate::replace{source, chars, 5});

  // act
  auto const& best = algo.run(std::stop_token{});

  // assert
  auto previous = start_.fitness();
  for (auto&& c : generations_) {
    ASSERT_GE(c.fitness(), previous);
    previous = c.fitness();
  }

  ASSERT_FALSE(generations_.empty());
  EXPECT_EQ(generations_.back().chromosome(), target);
  EXPECT_EQ(best.chromosome(), target);
}

} // namespace tests::algorithm
