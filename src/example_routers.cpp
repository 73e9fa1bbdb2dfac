#include "router.hpp"
#include "trace.hpp"
#include "web_exceptions.hpp"
#include <mutex>
#include <unordered_map>

namespace app {

// Small in-memory note store showing typed parameters and JSON bodies
class NotesRouter : public weblib::Router {
public:
  void route(weblib::RouteBuilder &routes) override {
    routes.path("/notes", [this, &routes] {
      routes.get("", [this](weblib::Context &ctx) { list(ctx); },
                 {"List notes", "", "listNotes", {"notes"}});
      routes.post("", [this](weblib::Context &ctx) { create(ctx); },
                  {"Create a note", "", "createNote", {"notes"}});
      routes.get("/{id}", [this](weblib::Context &ctx) { find(ctx); },
                 {"Find a note", "", "findNote", {"notes"}});
      routes.del("/{id}", [this](weblib::Context &ctx) { remove(ctx); },
                 {"Delete a note", "", "deleteNote", {"notes"}}, {"admin"});
    });
  }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, nlohmann::json> notes_;

  void list(weblib::Context &ctx) {
    auto limit = ctx.intQueryParam("limit").value_or(100);
    nlohmann::json result = nlohmann::json::array();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, note] : notes_) {
      if (static_cast<int>(result.size()) >= limit) {
        break;
      }
      result.push_back(note);
    }
    ctx.json(result);
  }

  void create(weblib::Context &ctx) {
    auto body = ctx.jsonMapper().read(ctx.body());
    if (!body.is_object() || !body.contains("text") ||
        !body["text"].is_string() || body["text"].get<std::string>().empty()) {
      throw weblib::ValidationException("text", "is required");
    }

    auto id = weblib::toString(weblib::newUuid4());
    nlohmann::json note = {{"id", id}, {"text", body["text"]}};
    if (auto session = weblib::Trace::currentSessionId()) {
      note["created_by_session"] = weblib::toString(*session);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      notes_[id] = note;
    }
    ctx.status(201).json(note);
  }

  void find(weblib::Context &ctx) {
    auto id = weblib::toString(ctx.idPathParam());
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = notes_.find(id);
    if (it == notes_.end()) {
      throw weblib::NotFoundException("Note not found", id);
    }
    ctx.json(it->second);
  }

  void remove(weblib::Context &ctx) {
    auto id = weblib::toString(ctx.idPathParam());
    std::lock_guard<std::mutex> lock(mutex_);
    if (notes_.erase(id) == 0) {
      throw weblib::NotFoundException("Note not found", id);
    }
    ctx.status(204);
  }
};

} // namespace app

WEBLIB_REGISTER_ROUTER(app::NotesRouter, "app.web.notes")
