#pragma once

#include <string>

// Converts note bodies between the HTML federated servers exchange and
// the plain text with light markdown that native clients show.
class TextTransformInterface
{
public:
    virtual ~TextTransformInterface() = default;
    virtual std::string htmlToMarkdown(const std::string& html) const = 0;
    virtual std::string markdownToHtml(const std::string& markdown) const = 0;
};

class GumboTextTransform : public TextTransformInterface
{
public:
    std::string htmlToMarkdown(const std::string& html) const override;
    std::string markdownToHtml(const std::string& markdown) const override;
};

std::string escapeHtml(const std::string& data);
