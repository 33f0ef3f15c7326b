#include "EntitySearchIndex.hpp"
#include "Log.hpp"
#include <QRegularExpression>
#include <algorithm>

QString EntitySearchIndex::normalize(const QString& text)
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);
    QString out;
    out.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        if (ch.category() != QChar::Mark_NonSpacing) {
            out.append(ch);
        }
    }
    return out;
}

double EntitySearchIndex::score(const QString& normalizedQuery, const QString& normalizedName)
{
    if (normalizedQuery.isEmpty() || !normalizedName.contains(normalizedQuery)) {
        return 0.0;
    }
    const double ratio = static_cast<double>(normalizedQuery.size()) / static_cast<double>(normalizedName.size());

    if (normalizedName == normalizedQuery) {
        return kExactScore;
    }
    if (normalizedName.startsWith(normalizedQuery)) {
        return kPrefixScore + ratio * kPrefixBonus;
    }
    const QRegularExpression wholeWord(QStringLiteral("\\b%1\\b").arg(QRegularExpression::escape(normalizedQuery)),
                                       QRegularExpression::UseUnicodePropertiesOption);
    if (wholeWord.match(normalizedName).hasMatch()) {
        return kWordScore + ratio * kWordBonus;
    }
    return kSubstringScore + ratio * kSubstringBonus;
}

std::vector<std::string> EntitySearchIndex::search(const std::string& query,
                                                   const std::vector<std::string>& names,
                                                   std::size_t limit)
{
    const QString needle = normalize(QString::fromStdString(query));
    if (needle.isEmpty()) {
        const auto n = std::min(limit, names.size());
        return {names.begin(), names.begin() + static_cast<std::ptrdiff_t>(n)};
    }

    struct Match {
        double             score;
        const std::string* name;
    };
    std::vector<Match> matches;
    for (const auto& name : names) {
        const double s = score(needle, normalize(QString::fromStdString(name)));
        if (s > 0.0) {
            matches.push_back({s, &name});
        }
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const Match& a, const Match& b) { return a.score > b.score; });

    std::vector<std::string> out;
    for (const auto& m : matches) {
        if (out.size() >= limit) break;
        out.push_back(*m.name);
    }
    LOG_D("search", "query '{}' matched {} of {} names", query, matches.size(), names.size());
    return out;
}
