#pragma once
#include "svcagent/types.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace svcagent::tools
{

/// A named, schema-described callable. Immutable once registered; replaced wholesale on
/// re-registration.
class Tool
{
  public:
    using Fn = std::function<svcagent::Json(const svcagent::Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, svcagent::Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const svcagent::Json& input_schema() const
    {
        return input_schema_;
    }

    /// Names listed under the schema's "properties".
    std::vector<std::string> parameter_names() const
    {
        std::vector<std::string> names;
        if (!input_schema_.is_object())
            return names;
        auto it = input_schema_.find("properties");
        if (it == input_schema_.end() || !it->is_object())
            return names;
        for (auto p = it->begin(); p != it->end(); ++p)
            names.push_back(p.key());
        return names;
    }

    /// Keep only the arguments the schema declares; the handler never sees anything else.
    svcagent::Json bind_arguments(const svcagent::Json& arguments) const
    {
        svcagent::Json bound = svcagent::Json::object();
        if (!arguments.is_object())
            return bound;
        auto props = input_schema_.is_object() ? input_schema_.find("properties")
                                               : input_schema_.end();
        bool has_props = input_schema_.is_object() && props != input_schema_.end() &&
                         props->is_object();
        for (auto it = arguments.begin(); it != arguments.end(); ++it)
            if (has_props && props->contains(it.key()))
                bound[it.key()] = it.value();
        return bound;
    }

    svcagent::Json invoke(const svcagent::Json& arguments) const
    {
        return fn_(bind_arguments(arguments));
    }

    explicit operator bool() const
    {
        return static_cast<bool>(fn_);
    }

  private:
    std::string name_;
    std::string description_;
    svcagent::Json input_schema_;
    Fn fn_;
};

/// Property entry for an input schema: {"type": type, "description": description}.
inline svcagent::Json schema_property(const std::string& type, const std::string& description)
{
    return svcagent::Json{{"type", type}, {"description", description}};
}

/// Object schema from a properties map and the list of required property names.
inline svcagent::Json object_schema(svcagent::Json properties,
                                    std::vector<std::string> required = {})
{
    return svcagent::Json{{"type", "object"},
                          {"properties", std::move(properties)},
                          {"required", std::move(required)}};
}

} // namespace svcagent::tools
