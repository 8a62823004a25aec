//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MovieServer.hpp
// Purpose: Movie listing and ticket booking server with simulated external calls
//==========================================================================================================
#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "scaffold/Handler.h"

//==========================================================================================================
// MovieServer
// Purpose: Static catalogue of four movies plus an in-memory booking table.
// Notes:
//   Bookings are shared across calls; bookingsMutex_ guards them.
//==========================================================================================================
class MovieServer : public scaffold::IServerInstance {
public:
    MovieServer();

    std::string Name() const override { return "MovieServer"; }
    std::string Instructions() const override;
    std::vector<scaffold::HandlerDefinition> Handlers() override;

    std::size_t BookingCount() const;

private:
    struct Movie {
        int64_t id;
        std::string title;
        std::vector<std::string> showTimes;
        double price;
    };

    static scaffold::JSONValue ToJSON(const Movie& m);
    const Movie* FindMovie(int64_t id) const;

    scaffold::HandlerResult GetMovies(const scaffold::Arguments& args);
    boost::asio::awaitable<scaffold::HandlerResult> GetMovieDetailsAsync(scaffold::Arguments args);
    boost::asio::awaitable<scaffold::HandlerResult> BookTicketAsync(scaffold::Arguments args);
    boost::asio::awaitable<scaffold::HandlerResult> GetBookingAsync(scaffold::Arguments args);
    boost::asio::awaitable<scaffold::HandlerResult> SearchMoviesAsync(scaffold::Arguments args);
    scaffold::HandlerResult RecommendMovie(const scaffold::Arguments& args);

    boost::asio::awaitable<scaffold::JSONValue> SearchLocal(std::string query);
    boost::asio::awaitable<scaffold::JSONValue> SearchExternal(std::string query);
    boost::asio::awaitable<scaffold::JSONValue> SearchRecommendations(std::string query);

    std::vector<Movie> movies_;
    mutable std::mutex bookingsMutex_;
    std::unordered_map<std::string, scaffold::JSONValue> bookings_;
};
