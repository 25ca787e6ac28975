#include "replies.h"
#include <iomanip>
#include <sstream>

namespace coop_assist {
namespace replies {

namespace {

constexpr size_t OVERVIEW_SAMPLES = 3;

std::string join_lines(const std::vector<std::string>& lines) {
    std::ostringstream oss;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) oss << "\n";
        oss << lines[i];
    }
    return oss.str();
}

} // namespace

std::string empty_message() {
    return "您好，请问想了解什么？可以问我商品、价格或者取货付款等规定。";
}

std::string greeting() {
    return "您好！欢迎来到我们的社区团购群，想买点什么或者有什么问题都可以问我。";
}

std::string identity() {
    return "我是团购群的小助手，可以帮您查商品、价格和群里的各项规定。"
           "具体订单问题也可以直接联系群主。";
}

std::string format_price(double price) {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(2) << price;
    return oss.str();
}

std::string catalog_overview(const catalog::ProductCatalog& catalog) {
    if (catalog.empty()) {
        return "目前还没有上架的商品，请稍后再来看看。";
    }
    std::ostringstream oss;
    oss << "我们目前有这些类别的商品:";
    for (const auto& category : catalog.categories()) {
        auto products = catalog.in_category(category);
        oss << "\n- " << category << ": ";
        for (size_t i = 0; i < products.size() && i < OVERVIEW_SAMPLES; ++i) {
            if (i) oss << "、";
            oss << products[i]->name;
        }
        if (products.size() > OVERVIEW_SAMPLES) {
            oss << " 等" << products.size() << "种";
        }
    }
    oss << "\n想了解哪一样，直接发商品名就可以。";
    return oss.str();
}

std::string product_detail(const catalog::Product& product, bool price_focus) {
    std::ostringstream oss;
    if (price_focus) {
        oss << product.display_name() << " 售价 " << format_price(product.price) << "。";
    } else {
        oss << "有的！" << product.display_name() << "，" << format_price(product.price) << "。";
    }
    if (!product.category.empty()) {
        oss << "\n类别: " << product.category;
    }
    if (!product.origin.empty()) {
        oss << "\n产地: " << product.origin;
    }
    if (!product.description.empty()) {
        oss << "\n" << product.description;
    }
    return oss.str();
}

std::string product_option_label(const catalog::Product& product) {
    return product.display_name() + " " + format_price(product.price);
}

std::string ambiguous_product(const std::string& cleaned, size_t shown, size_t total) {
    std::ostringstream oss;
    oss << "找到" << total << "个和「" << cleaned << "」相关的商品";
    if (shown < total) {
        oss << "，先列出最接近的" << shown << "个";
    }
    oss << "，请问您要哪一个？回复序号就可以。";
    return oss.str();
}

std::string product_not_found(const std::string& cleaned, bool has_suggestions,
                              const std::vector<std::string>& categories) {
    std::ostringstream oss;
    oss << "抱歉，暂时没有找到「" << cleaned << "」。";
    if (has_suggestions) {
        oss << "您是不是想找下面这些？";
    } else if (!categories.empty()) {
        oss << "目前在售的类别有: ";
        for (size_t i = 0; i < categories.size(); ++i) {
            if (i) oss << "、";
            oss << categories[i];
        }
        oss << "。";
    }
    return oss.str();
}

std::string recommendation_intro(const std::string& category) {
    if (category.empty()) {
        return "这几样最近很受欢迎，推荐给您:";
    }
    return "推荐几样" + category + ":";
}

std::string category_products(const std::string& category, size_t shown, size_t total) {
    std::ostringstream oss;
    oss << category << "类共有" << total << "样商品";
    if (shown < total) {
        oss << "，先列出最受欢迎的" << shown << "样";
    }
    oss << "，请问您要哪一个？回复序号就可以。";
    return oss.str();
}

std::string policy_answer(const std::vector<std::string>& sentences) {
    return join_lines(sentences);
}

std::string policy_list_intro() {
    return "我们的规定分成下面几类，想看哪一类？";
}

std::string policy_category(const policy::PolicyCategory& category,
                            const std::vector<const policy::PolicySentence*>& sentences) {
    std::ostringstream oss;
    oss << "【" << category.title << "】";
    if (sentences.empty()) {
        oss << "\n这一类暂时没有具体说明，请联系群主。";
    }
    for (const auto* s : sentences) {
        oss << "\n- " << s->content;
    }
    return oss.str();
}

std::string unknown_policy_category(const std::string& id) {
    return "抱歉，没有找到「" + id + "」这类规定。可以从下面的类别里选:";
}

std::string refund_guidance(const std::vector<std::string>& sentences) {
    std::ostringstream oss;
    oss << "很抱歉给您带来不便！";
    for (const auto& s : sentences) {
        oss << "\n- " << s;
    }
    oss << "\n请把订单信息和商品照片发给群主，我们会尽快处理。";
    return oss.str();
}

std::string selection_expired() {
    return "刚才的选项已经失效了，请重新告诉我您想找什么。";
}

std::string fallback_apology() {
    return "抱歉，这个问题我暂时回答不了，请稍后再试或者直接联系群主。";
}

} // namespace replies
} // namespace coop_assist
