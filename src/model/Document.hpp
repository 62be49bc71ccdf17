#pragma once
#include <string>
#include <optional>

namespace HonestMark {
    enum class ProductGroup {
        Clothes,
        Shoes,
        Tobacco,
        Perfumes,
        Tires,
        Electronics,
        Dairy
    };

    enum class DocumentFormat {
        Manual,
        Csv,
        Xml
    };

    enum class DocumentType {
        LpIntroduceGoods
    };

    // Wire names, e.g. ProductGroup::Shoes -> "SHOES".
    std::string ToString(ProductGroup group);
    std::string ToString(DocumentFormat format);
    std::string ToString(DocumentType type);

    // Reverse of ToString(ProductGroup); case-insensitive. Empty on unknown names.
    std::optional<ProductGroup> ProductGroupFromString(const std::string& name);

    // Immutable once built. Unset enum fields stay empty so validation can reject them.
    class Document {
    public:
        const std::string& product_document() const { return product_document_; }
        const std::optional<ProductGroup>& product_group() const { return product_group_; }
        const std::optional<DocumentFormat>& document_format() const { return document_format_; }
        const std::optional<DocumentType>& type() const { return type_; }

    private:
        friend class DocumentBuilder;

        std::string product_document_;
        std::optional<ProductGroup> product_group_;
        std::optional<DocumentFormat> document_format_;
        std::optional<DocumentType> type_;
    };

    class DocumentBuilder {
    public:
        DocumentBuilder& ProductDocument(std::string content);
        DocumentBuilder& Group(ProductGroup group);
        DocumentBuilder& Format(DocumentFormat format);
        DocumentBuilder& Type(DocumentType type);
        Document Build() const;

    private:
        Document document_;
    };

    // Outbound projection of a Document, produced once per Submit().
    struct DocumentRequest {
        std::string product_document;
        std::string product_group;
        DocumentFormat document_format = DocumentFormat::Manual;
        DocumentType type = DocumentType::LpIntroduceGoods;
        std::string signature;
    };

    struct DocumentResponse {
        std::string value;
        std::string error_code;
        std::string error_message;
        std::string error_description;

        // Sole success/failure discriminator; an error wins over a value.
        bool HasError() const { return !error_code.empty() || !error_message.empty(); }
    };
}
