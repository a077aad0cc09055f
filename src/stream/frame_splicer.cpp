#include "frame_splicer.hpp"

namespace nimproxy {

namespace {

const char* const kReasoningKeys[] = {"reasoning_content", "reasoning"};

Frame* delta_of(Frame& frame) {
    if (!frame.is_object()) return nullptr;
    auto choices = frame.find("choices");
    if (choices == frame.end() || !choices->is_array() || choices->empty())
        return nullptr;
    auto& choice = (*choices)[0];
    if (!choice.is_object()) return nullptr;
    auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) return nullptr;
    return &*delta;
}

void erase_reasoning(Frame& delta) {
    for (const char* key : kReasoningKeys)
        delta.erase(key);
}

} // namespace

std::string reasoning_text(const Frame& obj) {
    if (!obj.is_object()) return {};
    for (const char* key : kReasoningKeys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            return it->get<std::string>();
    }
    return {};
}

SpliceResult splice_frame(const Frame& frame, bool span_open,
                          const ReasoningMarkers& markers) {
    SpliceResult result{frame, span_open};
    Frame* delta = delta_of(result.frame);
    if (!delta) return result;

    std::string reasoning = reasoning_text(*delta);

    bool content_is_string = false;
    bool other_content = false; // non-string, non-null content is left alone
    std::string content;
    auto it = delta->find("content");
    if (it != delta->end()) {
        if (it->is_string()) {
            content_is_string = true;
            content = it->get<std::string>();
        } else if (!it->is_null()) {
            other_content = true;
        }
    }

    erase_reasoning(*delta);

    std::string out;
    if (!reasoning.empty()) {
        if (!result.span_open) {
            out += markers.open;
            result.span_open = true;
        }
        out += reasoning;
    }
    if (!content.empty()) {
        if (result.span_open) {
            out += markers.close;
            result.span_open = false;
        }
        out += content;
    }

    if (!out.empty()) {
        (*delta)["content"] = out;
    } else if (content_is_string) {
        // An explicit "" stays
        (*delta)["content"] = "";
    } else if (!other_content) {
        delta->erase("content");
    }
    return result;
}

Frame strip_reasoning(const Frame& frame) {
    Frame out = frame;
    Frame* delta = delta_of(out);
    if (!delta) return out;

    erase_reasoning(*delta);
    auto it = delta->find("content");
    if (it == delta->end() || it->is_null())
        (*delta)["content"] = "";
    return out;
}

std::string join_reasoning(const std::string& reasoning, const std::string& content,
                           const ReasoningMarkers& markers) {
    if (reasoning.empty()) return content;
    return markers.open + reasoning + markers.close + content;
}

} // namespace nimproxy
