// Copyright 2018 Your Name <your_email>

#include <link_extractor.hpp>

#include <gumbo.h>

namespace linkcheck {

namespace {

void search_for_links(const GumboNode* node, std::vector<std::string>* links) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return;
    }
    GumboAttribute* href;
    if (node->v.element.tag == GUMBO_TAG_A &&
        (href = gumbo_get_attribute(&node->v.element.attributes, "href"))) {
        links->push_back(href->value);
    }
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        search_for_links(static_cast<const GumboNode*>(children->data[i]),
                         links);
    }
}

}  // namespace

std::vector<std::string> extract_links(const std::string& html) {
    std::vector<std::string> links;
    GumboOutput* output = gumbo_parse_with_options(
            &kGumboDefaultOptions, html.data(), html.size());
    if (output == nullptr) return links;
    search_for_links(output->root, &links);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return links;
}

}  // namespace linkcheck
