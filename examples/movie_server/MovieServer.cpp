//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MovieServer.cpp
// Purpose: Movie tools (catalogue, details, booking, concurrent search) and a recommendation prompt
//==========================================================================================================

#include "MovieServer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "scaffold/async/Awaitables.h"
#include "scaffold/errors/Errors.h"
#include "scaffold/typed/Content.h"

using namespace scaffold;
using namespace std::chrono_literals;
namespace net = boost::asio;

namespace {

double nowSeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

JSONValue domainError(const std::string& message) {
    JSONValue::Object obj;
    obj["error"] = std::make_shared<JSONValue>(message);
    return JSONValue{std::move(obj)};
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Upper-cases the first letter of every word: "the matrix" -> "The Matrix"
std::string titleCase(const std::string& s) {
    std::string out = s;
    bool startOfWord = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            ch = static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return out;
}

JSONValue searchHit(const std::string& id, const std::string& title, const char* source) {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["title"] = std::make_shared<JSONValue>(title);
    obj["source"] = std::make_shared<JSONValue>(std::string(source));
    return JSONValue{std::move(obj)};
}

} // namespace

MovieServer::MovieServer()
    : movies_{
          {1, "Avengers: Endgame", {"10:00", "13:30", "17:00", "20:30"}, 12.99},
          {2, "The Matrix Resurrections", {"11:00", "14:00", "18:30", "21:00"}, 11.99},
          {3, "Dune", {"10:30", "13:00", "16:30", "20:00"}, 12.99},
          {4, "No Time to Die", {"11:30", "15:00", "18:00", "21:30"}, 13.99},
      } {}

std::string MovieServer::Instructions() const {
    return "This async movie server provides movie information, ticket booking, and external API "
           "integration with concurrent execution support.";
}

std::size_t MovieServer::BookingCount() const {
    std::lock_guard<std::mutex> lock(bookingsMutex_);
    return bookings_.size();
}

JSONValue MovieServer::ToJSON(const Movie& m) {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(m.id);
    obj["title"] = std::make_shared<JSONValue>(m.title);
    JSONValue::Array times;
    for (const auto& t : m.showTimes) {
        times.push_back(std::make_shared<JSONValue>(t));
    }
    obj["showTimes"] = std::make_shared<JSONValue>(std::move(times));
    obj["price"] = std::make_shared<JSONValue>(m.price);
    return JSONValue{std::move(obj)};
}

const MovieServer::Movie* MovieServer::FindMovie(int64_t id) const {
    auto it = std::find_if(movies_.begin(), movies_.end(), [id](const Movie& m) { return m.id == id; });
    return it == movies_.end() ? nullptr : &*it;
}

std::vector<HandlerDefinition> MovieServer::Handlers() {
    return {
        HandlerBuilder("tool_get_movies")
            .Doc("Get a list of movies currently playing in theaters (synchronous).")
            .Sync([this](const Arguments& args) { return GetMovies(args); }),
        HandlerBuilder("tool_get_movie_details_async")
            .Doc("Get detailed information about a specific movie (asynchronous with API simulation).")
            .Param<int64_t>("movie_id")
            .Async([this](Arguments args) { return GetMovieDetailsAsync(std::move(args)); }),
        HandlerBuilder("tool_book_ticket_async")
            .Doc("Book movie tickets for a specific showing (asynchronous with payment processing).")
            .Param<int64_t>("movie_id")
            .Param<std::string>("show_time")
            .Param<int64_t>("num_tickets")
            .Param<std::string>("customer_email")
            .Async([this](Arguments args) { return BookTicketAsync(std::move(args)); }),
        HandlerBuilder("tool_get_booking_async")
            .Doc("Retrieve booking details by booking ID (asynchronous).")
            .Param<std::string>("booking_id")
            .Async([this](Arguments args) { return GetBookingAsync(std::move(args)); }),
        HandlerBuilder("tool_search_movies_async")
            .Doc("Search for movies by title (asynchronous with multiple API calls).")
            .Param<std::string>("query")
            .Async([this](Arguments args) { return SearchMoviesAsync(std::move(args)); }),
        HandlerBuilder("prompt_recommend_movie")
            .Doc("Generate a prompt asking for a movie recommendation from the current catalogue.\n"
                 "Categories: movies, recommendation")
            .Param<std::string>("genre")
            .Param<std::string>("audience", JSONValue("general"))
            .Sync([this](const Arguments& args) { return RecommendMovie(args); }),
    };
}

HandlerResult MovieServer::GetMovies(const Arguments& /*args*/) {
    JSONValue::Array movies;
    for (const auto& m : movies_) {
        movies.push_back(std::make_shared<JSONValue>(ToJSON(m)));
    }
    JSONValue::Object obj;
    obj["movies"] = std::make_shared<JSONValue>(std::move(movies));
    obj["retrieved_at"] = std::make_shared<JSONValue>(nowSeconds());
    obj["async"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(obj)};
}

net::awaitable<HandlerResult> MovieServer::GetMovieDetailsAsync(Arguments args) {
    const int64_t movieId = args.GetInt("movie_id");
    // Catalogue lookup, then a second simulated call for the extended details
    co_await async::Sleep(500ms);
    const Movie* movie = FindMovie(movieId);
    if (!movie) {
        co_return domainError(fmt::format("Movie with ID {} not found", movieId));
    }
    co_await async::Sleep(300ms);

    JSONValue details = ToJSON(*movie);
    auto& obj = std::get<JSONValue::Object>(details.value);
    obj["director"] = std::make_shared<JSONValue>(std::string("Sample Director"));
    JSONValue::Array genre;
    genre.push_back(std::make_shared<JSONValue>(std::string("Action")));
    genre.push_back(std::make_shared<JSONValue>(std::string("Adventure")));
    obj["genre"] = std::make_shared<JSONValue>(std::move(genre));
    obj["rating"] = std::make_shared<JSONValue>(std::string("PG-13"));
    obj["duration"] = std::make_shared<JSONValue>(std::string("180 minutes"));
    obj["description"] = std::make_shared<JSONValue>("This is the description for " + movie->title);
    obj["retrieved_at"] = std::make_shared<JSONValue>(nowSeconds());
    obj["async"] = std::make_shared<JSONValue>(true);
    co_return details;
}

net::awaitable<HandlerResult> MovieServer::BookTicketAsync(Arguments args) {
    const auto* movieId = std::get_if<int64_t>(&args.Get("movie_id").value);
    const auto* showTime = std::get_if<std::string>(&args.Get("show_time").value);
    const auto* numTickets = std::get_if<int64_t>(&args.Get("num_tickets").value);
    const auto* email = std::get_if<std::string>(&args.Get("customer_email").value);
    if (!movieId || *movieId <= 0 || !showTime || trim(*showTime).empty() ||
        !numTickets || *numTickets <= 0 || !email || email->find('@') == std::string::npos) {
        co_return domainError("Invalid booking parameters");
    }

    const Movie* movie = FindMovie(*movieId);
    if (!movie) {
        co_return domainError(fmt::format("Movie with ID {} not found", *movieId));
    }
    if (std::find(movie->showTimes.begin(), movie->showTimes.end(), *showTime) == movie->showTimes.end()) {
        co_return domainError(fmt::format("Show time {} not available for {}", *showTime, movie->title));
    }

    LOG_INFO("Checking seat availability for {} at {}", movie->title, *showTime);
    co_await async::Sleep(400ms);

    LOG_INFO("Processing payment for {} tickets", *numTickets);
    const double totalPrice = static_cast<double>(*numTickets) * movie->price;
    co_await async::Sleep(600ms);

    const auto now = nowSeconds();
    const std::string bookingId = fmt::format("BK{}{}", static_cast<int64_t>(now), *movieId);
    JSONValue::Object booking;
    booking["booking_id"] = std::make_shared<JSONValue>(bookingId);
    booking["movie_id"] = std::make_shared<JSONValue>(*movieId);
    booking["movie_title"] = std::make_shared<JSONValue>(movie->title);
    booking["show_time"] = std::make_shared<JSONValue>(*showTime);
    booking["num_tickets"] = std::make_shared<JSONValue>(*numTickets);
    booking["total_price"] = std::make_shared<JSONValue>(totalPrice);
    booking["customer_email"] = std::make_shared<JSONValue>(*email);
    booking["booking_time"] = std::make_shared<JSONValue>(now);
    booking["status"] = std::make_shared<JSONValue>(std::string("confirmed"));
    booking["async"] = std::make_shared<JSONValue>(true);
    JSONValue details{std::move(booking)};

    co_await async::Sleep(200ms);
    {
        std::lock_guard<std::mutex> lock(bookingsMutex_);
        bookings_[bookingId] = details;
    }

    LOG_INFO("Sending confirmation email to {}", *email);
    co_await async::Sleep(300ms);
    co_return details;
}

net::awaitable<HandlerResult> MovieServer::GetBookingAsync(Arguments args) {
    const std::string bookingId = args.GetString("booking_id");
    co_await async::Sleep(200ms);

    std::optional<JSONValue> found;
    {
        std::lock_guard<std::mutex> lock(bookingsMutex_);
        auto it = bookings_.find(bookingId);
        if (it != bookings_.end()) {
            found = it->second;
        }
    }
    if (!found.has_value()) {
        co_return domainError("Booking " + bookingId + " not found");
    }
    std::get<JSONValue::Object>(found->value)["retrieved_at"] = std::make_shared<JSONValue>(nowSeconds());
    co_return found;
}

net::awaitable<HandlerResult> MovieServer::SearchMoviesAsync(Arguments args) {
    const std::string raw = args.GetString("query");
    const std::string query = toLower(trim(raw));
    if (query.empty()) {
        co_return domainError("Search query cannot be empty");
    }

    std::vector<net::awaitable<JSONValue>> branches;
    branches.push_back(SearchLocal(query));
    branches.push_back(SearchExternal(query));
    branches.push_back(SearchRecommendations(query));
    std::vector<JSONValue> results = co_await async::GatherAll(std::move(branches));

    const auto& local = std::get<JSONValue::Array>(results[0].value);
    const auto& external = std::get<JSONValue::Array>(results[1].value);

    JSONValue::Object obj;
    obj["query"] = std::make_shared<JSONValue>(query);
    obj["local_matches"] = std::make_shared<JSONValue>(results[0]);
    obj["external_matches"] = std::make_shared<JSONValue>(results[1]);
    obj["recommendations"] = std::make_shared<JSONValue>(results[2]);
    obj["total_results"] = std::make_shared<JSONValue>(static_cast<int64_t>(local.size() + external.size()));
    obj["search_time"] = std::make_shared<JSONValue>(nowSeconds());
    obj["async"] = std::make_shared<JSONValue>(true);
    co_return JSONValue{std::move(obj)};
}

net::awaitable<JSONValue> MovieServer::SearchLocal(std::string query) {
    co_await async::Sleep(100ms);
    JSONValue::Array matches;
    for (const auto& m : movies_) {
        if (toLower(m.title).find(query) != std::string::npos) {
            matches.push_back(std::make_shared<JSONValue>(ToJSON(m)));
        }
    }
    co_return JSONValue{std::move(matches)};
}

net::awaitable<JSONValue> MovieServer::SearchExternal(std::string query) {
    co_await async::Sleep(800ms);
    const std::string title = titleCase(query);
    JSONValue::Array hits;
    hits.push_back(std::make_shared<JSONValue>(searchHit("ext_1", "External Movie: " + title, "external_api")));
    hits.push_back(std::make_shared<JSONValue>(searchHit("ext_2", "Similar to " + title, "external_api")));
    co_return JSONValue{std::move(hits)};
}

net::awaitable<JSONValue> MovieServer::SearchRecommendations(std::string query) {
    co_await async::Sleep(500ms);
    const std::string title = titleCase(query);
    JSONValue::Array hits;
    hits.push_back(std::make_shared<JSONValue>(searchHit("rec_1", "Recommended: " + title + " 2", "recommendations")));
    hits.push_back(std::make_shared<JSONValue>(searchHit("rec_2", "You might like: " + title + " Redux", "recommendations")));
    co_return JSONValue{std::move(hits)};
}

HandlerResult MovieServer::RecommendMovie(const Arguments& args) {
    const std::string genre = trim(args.GetString("genre"));
    if (genre.empty()) {
        throw errors::ExecutionError("Genre cannot be empty");
    }
    const std::string audience = args.GetString("audience");
    std::string catalogue;
    for (const auto& m : movies_) {
        if (!catalogue.empty()) catalogue += ", ";
        catalogue += m.title;
    }
    JSONValue::Array messages;
    messages.push_back(std::make_shared<JSONValue>(typed::makeMessage(
        "assistant", "You recommend movies from this catalogue: " + catalogue + ".")));
    messages.push_back(std::make_shared<JSONValue>(typed::makeUserMessage(
        fmt::format("Recommend a {} movie suitable for a {} audience.", genre, audience))));
    return JSONValue{std::move(messages)};
}
